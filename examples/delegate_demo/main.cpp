/// @file main.cpp
/// @brief Delegate pickling demo
///
/// Builds a multicast delegate over two targets sharing one object, pickles
/// it in the configured format, reads it back and invokes the copy.
///
/// Usage: brine_delegate_demo [config.json]

#include <brine/pickle/pickle.hpp>

#include <brine/core/log.hpp>

#include <cstdlib>
#include <memory>
#include <string>

namespace {

std::shared_ptr<spdlog::logger> demo_log() {
    return brine_core::get_logger("delegate_demo");
}

struct Account {
    std::string owner;
    std::int64_t balance = 0;

    std::int64_t deposit(std::int64_t amount) {
        balance += amount;
        return balance;
    }

    std::int64_t report(std::int64_t) const {
        demo_log()->info("  {} holds {}", owner, balance);
        return balance;
    }
};

std::int64_t audit(std::int64_t amount) {
    demo_log()->info("  audit: {}", amount);
    return amount;
}

using Transaction = brine_pickle::Delegate<std::int64_t(std::int64_t)>;

struct BankMethods {
    brine_pickle::MethodHandle deposit;
    brine_pickle::MethodHandle report;
    brine_pickle::MethodHandle audit;
};

/// Register the methods and types a Transaction may reference
BankMethods register_bank(brine_pickle::PicklerResolver& resolver) {
    auto& methods = resolver.methods();
    BankMethods bank;
    bank.deposit = methods.register_instance("Account.deposit", &Account::deposit).unwrap();
    bank.report = methods.register_instance("Account.report", &Account::report).unwrap();
    bank.audit = methods.register_static("audit", &audit).unwrap();

    resolver.register_type<Account>("bank.Account").unwrap();
    resolver.register_factory<Account>([](brine_pickle::PicklerResolver& r) {
        return brine_pickle::RecordPickler::create<Account>(r,
            brine_pickle::field("owner", &Account::owner),
            brine_pickle::field("balance", &Account::balance));
    });
    return bank;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace brine_pickle;

    int exit_code = EXIT_FAILURE;
    try {
        SerializerConfig config;
        if (argc > 1) {
            auto loaded = SerializerConfig::load(argv[1]);
            if (!loaded) {
                demo_log()->error("{}", brine_core::build_error_chain(loaded.error()));
                brine_core::shutdown_logging();
                return EXIT_FAILURE;
            }
            config = std::move(*loaded);
        }
        apply_logging(config);

        PicklerResolver resolver;
        const BankMethods bank = register_bank(resolver);
        Serializer serializer(resolver, config);

        ObjectRef account = ObjectRef::make<Account>();
        account.get<Account>()->owner = "ada";
        account.get<Account>()->balance = 100;

        Transaction tx = Transaction::bind_static(bank.audit)
            + Transaction::bind(account, bank.deposit)
            + Transaction::bind(account, bank.report);

        demo_log()->info("Invoking original ({} bindings):", tx.size());
        tx(25);

        auto bytes = serializer.pickle(tx);
        demo_log()->info("Pickled to {} bytes ({})", bytes.size(), format_kind_name(config.format));

        Transaction copy = serializer.unpickle<Transaction>(bytes);
        demo_log()->info("Invoking copy:");
        const std::int64_t result = copy(10);

        const auto& list = copy.invocation_list();
        const bool shared = list[1].target == list[2].target;
        demo_log()->info("Copy returned {}; targets shared: {}; original balance: {}",
            result, shared, account.get<Account>()->balance);

        exit_code = shared ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const PicklerException& e) {
        demo_log()->error("Pickling failed:\n{}", e.what());
    } catch (const std::exception& e) {
        demo_log()->error("Demo failed: {}", e.what());
    }

    brine_core::shutdown_logging();
    return exit_code;
}
