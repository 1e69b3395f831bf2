/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/dnssd_session.hpp"

#include "nsdkit/core/exception.hpp"
#include "nsdkit/dnssd/mock/dnssd_mock_provider.hpp"

#include <boost/asio/executor_work_guard.hpp>

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <tuple>

namespace {

using State = nsd::dnssd::RegistrationController::State;
using DiscoveryState = nsd::dnssd::DiscoveryController::State;
using nsd::dnssd::ErrorKind;
using Requests = std::vector<std::string>;

/**
 * Session driven by a MockProvider, recording every notification in the order it was delivered.
 */
struct MockSession {
    boost::asio::io_context io_context;
    nsd::dnssd::MockProvider* provider {};
    std::unique_ptr<nsd::dnssd::Session> session;
    std::vector<std::string> events;
    std::vector<std::pair<ErrorKind, nsd::dnssd::ProviderStatus>> errors;
    std::vector<nsd::dnssd::ResolvedService> resolved;

    MockSession() {
        auto mock = std::make_unique<nsd::dnssd::MockProvider>(io_context);
        provider = mock.get();
        session = std::make_unique<nsd::dnssd::Session>(std::move(mock), io_context.get_executor());

        session->on_service_registered = [this](const std::string& name) {
            events.push_back("registered:" + name);
        };
        session->on_service_found = [this](const nsd::dnssd::ServiceReference& reference) {
            events.push_back("found:" + reference.name);
        };
        session->on_service_lost = [this](const nsd::dnssd::ServiceReference& reference) {
            events.push_back("lost:" + reference.name);
        };
        session->on_service_resolved = [this](const nsd::dnssd::ResolvedService& service) {
            events.push_back("resolved:" + service.name);
            resolved.push_back(service);
        };
        session->on_error = [this](const ErrorKind kind, const nsd::dnssd::ProviderStatus code) {
            events.push_back(std::string("error:") + nsd::dnssd::to_string(kind));
            errors.emplace_back(kind, code);
        };
    }

    void run() {
        io_context.restart();
        io_context.run();
    }

    [[nodiscard]] std::vector<std::string> known_names() const {
        std::vector<std::string> names;
        for (auto& service : session->get_known_services()) {
            names.push_back(service.name);
        }
        return names;
    }

    void register_and_confirm(const nsd::dnssd::ServiceDescriptor& descriptor) {
        session->register_service(descriptor);
        provider->mock_advertise_succeeded();
        run();
    }

    void discover_and_confirm(const std::string& reg_type) {
        session->discover(reg_type);
        provider->mock_watch_succeeded();
        run();
    }
};

nsd::dnssd::ServiceDescriptor make_descriptor(const std::string& name) {
    return nsd::dnssd::ServiceDescriptor {name, "_myproto._tcp", 5000, {{"version", "1"}}};
}

/**
 * Provider which hands every request over to a Stash which outlives it, so handlers can be invoked after the session
 * and the provider are gone.
 */
class StashProvider: public nsd::dnssd::Provider {
  public:
    struct Stash {
        AdvertiseHandler advertise;
        CompletionHandler withdraw;
        CompletionHandler watch;
        CompletionHandler unwatch;
        ResolveHandler resolve;
        nsd::SafeFunction<void(const nsd::dnssd::ServiceReference& reference)> found;
    };

    explicit StashProvider(std::shared_ptr<Stash> stash) : stash_(std::move(stash)) {}

    void advertise(const nsd::dnssd::ServiceDescriptor&, AdvertiseHandler handler) override {
        stash_->advertise = std::move(handler);
        stash_->found = on_service_found;
    }

    void withdraw(CompletionHandler handler) override {
        stash_->withdraw = std::move(handler);
    }

    void watch(const std::string&, CompletionHandler handler) override {
        stash_->watch = std::move(handler);
        stash_->found = on_service_found;
    }

    void unwatch(CompletionHandler handler) override {
        stash_->unwatch = std::move(handler);
    }

    void resolve(const nsd::dnssd::ServiceReference&, ResolveHandler handler) override {
        stash_->resolve = std::move(handler);
    }

  private:
    std::shared_ptr<Stash> stash_;
};

template<class Predicate>
bool wait_until(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}  // namespace

TEST_CASE("nsd::Session") {
    SECTION("Constructing without provider throws") {
        boost::asio::io_context io_context;
        REQUIRE_THROWS_AS(nsd::dnssd::Session(nullptr, io_context.get_executor()), nsd::Exception);
    }

    SECTION("Initial state") {
        MockSession s;
        REQUIRE(s.session->get_registration_state() == State::idle);
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::idle);
        REQUIRE(s.session->get_known_services().empty());
        REQUIRE_FALSE(s.session->get_registered_name().has_value());
        REQUIRE_FALSE(s.session->get_configuration().exclude_own_service);
    }

    SECTION("Describe status") {
        MockSession s;
        REQUIRE(
            s.session->describe_status(nsd::dnssd::status::already_active)
            == "The operation failed because it is already active."
        );
        REQUIRE(s.session->describe_status(-1234) == "Unknown error.");
    }
}

TEST_CASE("nsd::Session | Registration") {
    MockSession s;

    SECTION("Register a service") {
        const auto descriptor = make_descriptor("Foo");
        s.session->register_service(descriptor);

        REQUIRE(s.session->get_registration_state() == State::registering);
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo"});
        REQUIRE_FALSE(s.session->get_registered_name().has_value());

        s.provider->mock_advertise_succeeded();
        s.run();

        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.session->get_registered_name() == "Foo");
        REQUIRE(s.provider->get_advertised_service() == descriptor);
        REQUIRE(s.events == Requests {"registered:Foo"});
    }

    SECTION("The provider might rename the service") {
        s.session->register_service(make_descriptor("Foo"));
        s.provider->mock_advertise_succeeded("Foo (2)");
        s.run();

        REQUIRE(s.session->get_registered_name() == "Foo (2)");
        REQUIRE(s.events == Requests {"registered:Foo (2)"});
    }

    SECTION("Register while registering is ignored") {
        s.session->register_service(make_descriptor("Foo"));
        s.session->register_service(make_descriptor("Bar"));
        s.session->register_service(make_descriptor("Baz"));

        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo"});

        s.provider->mock_advertise_succeeded();
        s.run();

        REQUIRE(s.session->get_registered_name() == "Foo");
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo"});
    }

    SECTION("Register while registered withdraws first") {
        s.register_and_confirm(make_descriptor("A"));

        s.session->register_service(make_descriptor("B"));

        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw"});
        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.session->get_registered_name() == "A");

        s.provider->mock_withdraw_succeeded();
        s.run();

        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw", "advertise:B"});
        REQUIRE(s.session->get_registration_state() == State::registering);
        REQUIRE_FALSE(s.session->get_registered_name().has_value());

        s.provider->mock_advertise_succeeded();
        s.run();

        REQUIRE(s.session->get_registered_name() == "B");
        REQUIRE(s.events == Requests {"registered:A", "registered:B"});
    }

    SECTION("The latest request wins while a withdraw is pending") {
        s.register_and_confirm(make_descriptor("A"));

        s.session->register_service(make_descriptor("B"));
        s.session->register_service(make_descriptor("C"));

        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw"});

        s.provider->mock_withdraw_succeeded();
        s.run();

        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw", "advertise:C"});
    }

    SECTION("Register, unregister, register again") {
        const auto descriptor = make_descriptor("Foo");
        s.register_and_confirm(descriptor);

        s.session->unregister_service();
        REQUIRE(s.session->get_registration_state() == State::registered);

        s.provider->mock_withdraw_succeeded();
        s.run();

        REQUIRE(s.session->get_registration_state() == State::idle);
        REQUIRE_FALSE(s.session->get_registered_name().has_value());
        REQUIRE_FALSE(s.provider->get_advertised_service().has_value());

        s.register_and_confirm(descriptor);

        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.session->get_registered_name() == "Foo");
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo", "withdraw", "advertise:Foo"});
        REQUIRE(s.events == Requests {"registered:Foo", "registered:Foo"});
    }

    SECTION("Unregister without registration does nothing") {
        s.session->unregister_service();
        REQUIRE(s.provider->get_requests().empty());

        s.session->register_service(make_descriptor("Foo"));
        s.session->unregister_service();
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo"});
    }

    SECTION("Unregister twice withdraws once") {
        s.register_and_confirm(make_descriptor("Foo"));
        s.session->unregister_service();
        s.session->unregister_service();
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo", "withdraw"});
    }

    SECTION("Advertise failure") {
        s.session->register_service(make_descriptor("Foo"));
        s.provider->mock_advertise_failed(42);
        s.run();

        REQUIRE(s.session->get_registration_state() == State::idle);
        REQUIRE_FALSE(s.session->get_registered_name().has_value());
        REQUIRE(s.errors.size() == 1);
        REQUIRE(s.errors[0].first == ErrorKind::registration_failed);
        REQUIRE(s.errors[0].second == 42);
        REQUIRE(s.events == Requests {"error:registration_failed"});

        // The session remains usable.
        s.register_and_confirm(make_descriptor("Foo"));
        REQUIRE(s.session->get_registered_name() == "Foo");
        REQUIRE(s.errors.size() == 1);
    }

    SECTION("Withdraw failure keeps the registration") {
        s.register_and_confirm(make_descriptor("Foo"));
        s.session->unregister_service();
        s.provider->mock_withdraw_failed(7);
        s.run();

        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.session->get_registered_name() == "Foo");
        REQUIRE(s.errors.size() == 1);
        REQUIRE(s.errors[0].first == ErrorKind::unregistration_failed);
        REQUIRE(s.errors[0].second == 7);

        // Unregistering can be retried.
        s.session->unregister_service();
        s.provider->mock_withdraw_succeeded();
        s.run();

        REQUIRE(s.session->get_registration_state() == State::idle);
        REQUIRE(s.provider->get_requests() == Requests {"advertise:Foo", "withdraw", "withdraw"});
    }

    SECTION("Withdraw failure drops a pending registration") {
        s.register_and_confirm(make_descriptor("A"));
        s.session->register_service(make_descriptor("B"));
        s.provider->mock_withdraw_failed(7);
        s.run();

        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.session->get_registered_name() == "A");
        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw"});
        REQUIRE(s.errors.size() == 1);

        // A new request starts over.
        s.session->register_service(make_descriptor("C"));
        s.provider->mock_withdraw_succeeded();
        s.run();

        REQUIRE(s.provider->get_requests() == Requests {"advertise:A", "withdraw", "withdraw", "advertise:C"});
    }

    SECTION("Registering without service type throws") {
        auto descriptor = make_descriptor("Foo");
        descriptor.reg_type.clear();
        REQUIRE_THROWS_AS(s.session->register_service(descriptor), nsd::Exception);
        REQUIRE(s.provider->get_requests().empty());
        REQUIRE(s.session->get_registration_state() == State::idle);
    }
}

TEST_CASE("nsd::Session | Discovery") {
    MockSession s;

    SECTION("Find and lose a service") {
        s.session->discover("_http._tcp");
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::starting);

        s.provider->mock_watch_succeeded();
        s.run();
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::active);

        s.provider->mock_service_found("printer1");
        s.run();

        const auto known = s.session->get_known_services();
        REQUIRE(known.size() == 1);
        REQUIRE(known[0] == nsd::dnssd::ServiceReference {"printer1", "_http._tcp", "local."});

        s.provider->mock_service_lost("printer1");
        s.run();

        REQUIRE(s.session->get_known_services().empty());
        REQUIRE(s.events == Requests {"found:printer1", "lost:printer1"});
    }

    SECTION("Lost removes the first match and keeps the order") {
        s.discover_and_confirm("_http._tcp");
        s.provider->mock_service_found("a");
        s.provider->mock_service_found("b");
        s.provider->mock_service_found("c");
        s.provider->mock_service_found("b");
        s.run();

        REQUIRE(s.known_names() == Requests {"a", "b", "c", "b"});

        s.provider->mock_service_lost("b");
        s.run();

        REQUIRE(s.known_names() == Requests {"a", "c", "b"});
    }

    SECTION("Lost for an unknown service is forwarded without changes") {
        s.discover_and_confirm("_http._tcp");
        s.provider->mock_service_found("a");
        s.provider->mock_service_lost("x");
        s.run();

        REQUIRE(s.known_names() == Requests {"a"});
        REQUIRE(s.events == Requests {"found:a", "lost:x"});
    }

    SECTION("Discover while active restarts discovery") {
        s.discover_and_confirm("_t1._tcp");
        s.provider->mock_service_found("p1");
        s.run();
        REQUIRE(s.known_names() == Requests {"p1"});

        s.session->discover("_t2._tcp");

        REQUIRE(s.session->get_known_services().empty());
        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp", "unwatch"});
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::active);

        s.provider->mock_unwatch_succeeded();
        s.run();

        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp", "unwatch", "watch:_t2._tcp"});
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::starting);

        s.provider->mock_watch_succeeded();
        s.run();

        REQUIRE(s.session->get_discovery_state() == DiscoveryState::active);
        REQUIRE(s.provider->get_watched_type() == "_t2._tcp");
    }

    SECTION("The latest type wins while stopping") {
        s.discover_and_confirm("_t1._tcp");
        s.session->discover("_t2._tcp");
        s.session->discover("_t3._tcp");

        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp", "unwatch"});

        s.provider->mock_unwatch_succeeded();
        s.run();

        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp", "unwatch", "watch:_t3._tcp"});
    }

    SECTION("Discover while starting only clears the known services") {
        s.session->discover("_t1._tcp");
        s.session->discover("_t2._tcp");

        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp"});
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::starting);
    }

    SECTION("Stop discovery") {
        s.discover_and_confirm("_http._tcp");
        s.session->stop_discovery();
        s.session->stop_discovery();

        REQUIRE(s.provider->get_requests() == Requests {"watch:_http._tcp", "unwatch"});

        s.provider->mock_unwatch_succeeded();
        s.run();

        REQUIRE(s.session->get_discovery_state() == DiscoveryState::idle);
        REQUIRE_FALSE(s.provider->get_watched_type().has_value());
    }

    SECTION("Stop discovery when not active does nothing") {
        s.session->stop_discovery();
        s.session->discover("_http._tcp");
        s.session->stop_discovery();
        REQUIRE(s.provider->get_requests() == Requests {"watch:_http._tcp"});
    }

    SECTION("Watch failure") {
        s.session->discover("_http._tcp");
        s.provider->mock_watch_failed(nsd::dnssd::status::max_limit);
        s.run();

        REQUIRE(s.session->get_discovery_state() == DiscoveryState::idle);
        REQUIRE(s.errors.size() == 1);
        REQUIRE(s.errors[0].first == ErrorKind::start_discovery_failed);
        REQUIRE(s.errors[0].second == nsd::dnssd::status::max_limit);

        s.discover_and_confirm("_http._tcp");
        REQUIRE(s.session->get_discovery_state() == DiscoveryState::active);
    }

    SECTION("Unwatch failure keeps discovery active") {
        s.discover_and_confirm("_t1._tcp");
        s.session->discover("_t2._tcp");
        s.provider->mock_unwatch_failed(9);
        s.run();

        REQUIRE(s.session->get_discovery_state() == DiscoveryState::active);
        REQUIRE(s.provider->get_requests() == Requests {"watch:_t1._tcp", "unwatch"});
        REQUIRE(s.errors.size() == 1);
        REQUIRE(s.errors[0].first == ErrorKind::stop_discovery_failed);
        REQUIRE(s.errors[0].second == 9);

        s.session->stop_discovery();
        s.provider->mock_unwatch_succeeded();
        s.run();

        REQUIRE(s.session->get_discovery_state() == DiscoveryState::idle);
    }

    SECTION("Discovering without service type throws") {
        REQUIRE_THROWS_AS(s.session->discover(""), nsd::Exception);
        REQUIRE(s.provider->get_requests().empty());
    }
}

TEST_CASE("nsd::Session | Exclude own service") {
    MockSession s;
    s.register_and_confirm(make_descriptor("Foo"));
    s.discover_and_confirm("_myproto._tcp");

    SECTION("Own service is reported by default") {
        s.provider->mock_service_found("Foo");
        s.run();

        REQUIRE(s.known_names() == Requests {"Foo"});
        REQUIRE(s.events == Requests {"registered:Foo", "found:Foo"});
    }

    SECTION("Own service is excluded when enabled") {
        s.session->set_exclude_own_service(true);
        s.provider->mock_service_found("Foo");
        s.provider->mock_service_found("Bar");
        s.run();

        REQUIRE(s.known_names() == Requests {"Bar"});
        REQUIRE(s.events == Requests {"registered:Foo", "found:Bar"});
    }

    SECTION("Exclusion uses the effective name") {
        s.session->set_configuration({true});
        s.session->register_service(make_descriptor("Other"));
        s.provider->mock_withdraw_succeeded();
        s.run();
        s.provider->mock_advertise_succeeded("Other (2)");
        s.run();

        s.provider->mock_service_found("Other");
        s.provider->mock_service_found("Other (2)");
        s.run();

        REQUIRE(s.known_names() == Requests {"Other"});
        REQUIRE(s.session->get_configuration().exclude_own_service);
    }
}

TEST_CASE("nsd::Session | Resolve") {
    MockSession s;
    const nsd::dnssd::ServiceReference printer {"printer1", "_ipp._tcp", "local."};

    SECTION("Resolve a service") {
        s.session->resolve(printer);
        s.provider->mock_resolve_succeeded("printer1", "printer.local.", "192.168.1.10", 631, {{"rp", "ipp"}});
        s.run();

        REQUIRE(s.resolved.size() == 1);
        REQUIRE(s.resolved[0].reference() == printer);
        REQUIRE(s.resolved[0].host_target == "printer.local.");
        REQUIRE(s.resolved[0].address == "192.168.1.10");
        REQUIRE(s.resolved[0].port == 631);
        REQUIRE(s.resolved[0].txt.at("rp") == "ipp");
    }

    SECTION("Concurrent resolves are passed straight through") {
        s.session->resolve(printer);
        s.session->resolve(printer);
        s.session->resolve({"scanner", "_uscan._tcp", "local."});

        REQUIRE(s.provider->get_pending_resolve_count() == 3);
        REQUIRE(
            s.provider->get_requests() == Requests {"resolve:printer1", "resolve:printer1", "resolve:scanner"}
        );

        s.provider->mock_resolve_succeeded("scanner", "scanner.local.", "192.168.1.11", 8080, {});
        s.provider->mock_resolve_failed("printer1", 5);
        s.provider->mock_resolve_succeeded("printer1", "printer.local.", "192.168.1.10", 631, {});
        s.run();

        REQUIRE(s.events == Requests {"resolved:scanner", "error:resolve_failed", "resolved:printer1"});
        REQUIRE(s.errors.size() == 1);
        REQUIRE(s.errors[0].first == ErrorKind::resolve_failed);
        REQUIRE(s.errors[0].second == 5);
        REQUIRE(s.provider->get_pending_resolve_count() == 0);
    }

    SECTION("Resolving without name throws") {
        REQUIRE_THROWS_AS(s.session->resolve(nsd::dnssd::ServiceReference {}), nsd::Exception);
        REQUIRE(s.provider->get_requests().empty());
    }
}

TEST_CASE("nsd::Session | Notifications") {
    SECTION("Notifications are delivered in the order of the events") {
        MockSession s;
        s.session->register_service(make_descriptor("Foo"));
        s.session->discover("_http._tcp");
        s.provider->mock_watch_succeeded();
        s.provider->mock_service_found("a");
        s.provider->mock_advertise_succeeded();
        s.provider->mock_service_lost("a");
        s.provider->mock_service_found("b");
        s.run();

        REQUIRE(s.events == Requests {"found:a", "registered:Foo", "lost:a", "found:b"});
    }

    SECTION("Notifications are delivered on the given executor") {
        MockSession s;
        s.session->register_service(make_descriptor("Foo"));
        s.provider->mock_advertise_succeeded();

        // Run only the provider completion, the notification is posted separately.
        s.io_context.run_one();
        REQUIRE(s.session->get_registration_state() == State::registered);
        REQUIRE(s.events.empty());

        s.run();
        REQUIRE(s.events == Requests {"registered:Foo"});
    }

    SECTION("Known services are a snapshot") {
        MockSession s;
        s.discover_and_confirm("_http._tcp");
        s.provider->mock_service_found("a");
        s.run();

        auto known = s.session->get_known_services();
        known.clear();
        REQUIRE(s.known_names() == Requests {"a"});
    }
}

TEST_CASE("nsd::Session | Lifetime") {
    SECTION("Destroying with a notification queued") {
        MockSession s;
        s.session->register_service(make_descriptor("Foo"));
        s.provider->mock_advertise_succeeded();

        // Runs the provider completion, which posts the notification.
        s.io_context.run_one();
        REQUIRE(s.session->get_registration_state() == State::registered);

        s.session.reset();
        s.provider = nullptr;
        s.run();
        REQUIRE(s.events.empty());
    }

    SECTION("Destroying with a provider completion queued") {
        MockSession s;
        s.session->register_service(make_descriptor("Foo"));
        s.session->resolve({"printer", "_ipp._tcp.", "local."});
        s.provider->mock_advertise_succeeded();
        s.provider->mock_resolve_failed("printer", nsd::dnssd::status::internal_error);

        s.session.reset();
        s.provider = nullptr;
        s.run();
        REQUIRE(s.events.empty());
    }

    SECTION("Destroying with found and lost events queued") {
        MockSession s;
        s.discover_and_confirm("_http._tcp");
        s.provider->mock_service_found("a");
        s.provider->mock_service_lost("a");

        s.session.reset();
        s.provider = nullptr;
        s.run();
        REQUIRE(s.events.empty());
    }

    SECTION("Handlers invoked after the session is gone do nothing") {
        boost::asio::io_context io_context;
        auto stash = std::make_shared<StashProvider::Stash>();
        std::vector<std::string> events;

        auto session = std::make_unique<nsd::dnssd::Session>(
            std::make_unique<StashProvider>(stash), io_context.get_executor()
        );
        session->on_service_registered = [&events](const std::string& name) {
            events.push_back("registered:" + name);
        };
        session->on_service_found = [&events](const nsd::dnssd::ServiceReference& reference) {
            events.push_back("found:" + reference.name);
        };
        session->on_service_resolved = [&events](const nsd::dnssd::ResolvedService& service) {
            events.push_back("resolved:" + service.name);
        };
        session->on_error = [&events](const ErrorKind kind, nsd::dnssd::ProviderStatus) {
            events.push_back(std::string("error:") + nsd::dnssd::to_string(kind));
        };

        session->register_service(make_descriptor("Foo"));
        session->discover("_http._tcp");
        session->resolve({"printer", "_ipp._tcp.", "local."});
        REQUIRE(stash->advertise);
        REQUIRE(stash->watch);
        REQUIRE(stash->resolve);
        REQUIRE(stash->found);

        session.reset();

        stash->advertise(std::string("Foo"));
        stash->watch({});
        stash->found({"a", "_http._tcp.", "local."});
        stash->resolve(tl::unexpected(nsd::dnssd::status::internal_error));
        io_context.run();

        REQUIRE(events.empty());
    }
}

TEST_CASE("nsd::Session | Threads") {
    MockSession s;
    auto work = boost::asio::make_work_guard(s.io_context);
    std::thread io_thread([&s] {
        s.io_context.run();
    });

    std::atomic<bool> stop_reading {false};
    std::atomic<size_t> reads {0};
    std::thread reader([&s, &stop_reading, &reads] {
        while (!stop_reading) {
            std::ignore = s.session->get_known_services();
            std::ignore = s.session->get_registered_name();
            std::ignore = s.session->get_registration_state();
            std::ignore = s.session->get_discovery_state();
            s.session->set_exclude_own_service(false);
            ++reads;
        }
    });

    constexpr int num_services = 100;

    // Every step waits for the state the next mock call relies on, so the provider is never used out of order.
    auto drive = [&s] {
        s.session->discover("_t._tcp");
        s.provider->mock_watch_succeeded();
        if (!wait_until([&s] {
                return s.session->get_discovery_state() == DiscoveryState::active;
            })) {
            return false;
        }

        for (int i = 0; i < num_services; ++i) {
            s.provider->mock_service_found("svc" + std::to_string(i));
        }

        s.session->register_service(make_descriptor("A"));
        s.provider->mock_advertise_succeeded();

        for (int i = 0; i < num_services / 2; ++i) {
            s.provider->mock_service_lost("svc" + std::to_string(i));
        }

        if (!wait_until([&s] {
                return s.session->get_registered_name() == "A";
            })) {
            return false;
        }

        s.session->register_service(make_descriptor("B"));
        s.provider->mock_withdraw_succeeded();
        const Requests expected_requests {"watch:_t._tcp", "advertise:A", "withdraw", "advertise:B"};
        if (!wait_until([&s, &expected_requests] {
                return s.provider->get_requests() == expected_requests;
            })) {
            return false;
        }

        s.provider->mock_advertise_succeeded();
        return wait_until([&s] {
            return s.session->get_registered_name() == "B"
                && s.session->get_known_services().size() == static_cast<size_t>(num_services / 2);
        });
    };

    const bool completed = drive();

    // Lets the last notifications through before stopping.
    boost::asio::post(s.io_context, [&work] {
        work.reset();
    });
    io_thread.join();
    stop_reading = true;
    reader.join();

    REQUIRE(completed);
    REQUIRE(reads > 0);

    Requests expected_known;
    for (int i = num_services / 2; i < num_services; ++i) {
        expected_known.push_back("svc" + std::to_string(i));
    }
    REQUIRE(s.known_names() == expected_known);

    const auto count_events = [&s](const std::string& prefix) {
        return std::count_if(s.events.begin(), s.events.end(), [&prefix](const std::string& event) {
            return event.rfind(prefix, 0) == 0;
        });
    };
    REQUIRE(count_events("found:") == num_services);
    REQUIRE(count_events("lost:") == num_services / 2);
    REQUIRE(count_events("error:") == 0);

    const auto registered_a = std::find(s.events.begin(), s.events.end(), "registered:A");
    const auto registered_b = std::find(s.events.begin(), s.events.end(), "registered:B");
    REQUIRE(registered_a != s.events.end());
    REQUIRE(registered_b != s.events.end());
    REQUIRE(registered_a < registered_b);
}
