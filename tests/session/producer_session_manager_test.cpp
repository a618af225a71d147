#include <catch2/catch_test_macros.hpp>

#include <type_traits>

#include "hindsight/core/session/producer_session_manager.hpp"
#include "support/test_support.hpp"

using namespace hindsight::core;
using hindsight::test::FakeProbe;
using hindsight::test::IoThread;
using hindsight::test::wait_until;

namespace {

template <typename T, typename = void>
struct has_tracer : std::false_type {};

template <typename T>
struct has_tracer<T, std::void_t<decltype(std::declval<const T&>().tracer())>> : std::true_type {};

}  // namespace

// Discovery must never be able to emit spans about itself.
static_assert(!has_tracer<session::ControlSession>::value, "control sessions carry no tracer");
static_assert(has_tracer<session::DataSession>::value, "data sessions expose their tracer");
static_assert(!std::is_convertible<session::DataSession, session::ControlSession>::value,
              "data and control sessions are distinct types");

TEST_CASE("Session manager splits connections and starts discovery", "[session]") {
    IoThread io;
    auto registry = std::make_shared<discovery::CapabilityRegistry>(io.context(), nullptr,
                                                                    std::chrono::milliseconds(500));
    auto telemetry = std::make_shared<observability::Telemetry>(observability::Telemetry::Mode::noop);
    session::ProducerSessionManager manager(registry, telemetry, nullptr);

    auto probe = std::make_shared<FakeProbe>(FakeProbe::Mode::reply, std::vector<std::string>{"picante.Query"});
    auto data = manager.on_connection_ready("10.0.0.5:41000", probe);

    REQUIRE(data != nullptr);
    REQUIRE(data->id().rfind("sess_", 0) == 0);
    REQUIRE(data->id().size() == 5 + 16);
    REQUIRE(data->endpoint() == "10.0.0.5:41000");
    REQUIRE(data->tracer() != nullptr);
    REQUIRE(manager.find_data_session(data->id()) == data);
    REQUIRE(probe->calls() == 1);

    REQUIRE(wait_until([&] { return registry->find(data->id()).has_value(); }));

    auto sessions = manager.get_active_sessions();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].status == session::SessionStatus::Active);
    REQUIRE(sessions[0].capabilities.has_value());
    REQUIRE(sessions[0].capabilities->supports("picante.Query"));

    manager.on_disconnect(data->id());
    REQUIRE(manager.session_count() == 0);
    REQUIRE(manager.find_data_session(data->id()) == nullptr);
    REQUIRE_FALSE(registry->find(data->id()).has_value());
}

TEST_CASE("Sessions stay in discovery until the producer answers", "[session]") {
    IoThread io;
    auto registry = std::make_shared<discovery::CapabilityRegistry>(io.context(), nullptr,
                                                                    std::chrono::milliseconds(2000));
    session::ProducerSessionManager manager(registry, nullptr, nullptr);

    auto probe = std::make_shared<FakeProbe>(FakeProbe::Mode::silent, std::vector<std::string>{"rapace.Users"});
    auto data = manager.on_connection_ready("10.0.0.6:41000", probe);
    REQUIRE(data->tracer() == nullptr);

    auto sessions = manager.get_active_sessions();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].status == session::SessionStatus::Discovering);
    REQUIRE_FALSE(sessions[0].capabilities.has_value());

    REQUIRE(probe->respond());
    REQUIRE(wait_until([&] { return registry->supports(data->id(), "rapace.Users"); }));
    REQUIRE(manager.get_active_sessions()[0].status == session::SessionStatus::Active);
}

TEST_CASE("Session ids are unique and shutdown forgets them", "[session]") {
    IoThread io;
    auto registry = std::make_shared<discovery::CapabilityRegistry>(io.context(), nullptr,
                                                                    std::chrono::milliseconds(500));
    session::ProducerSessionManager manager(registry, nullptr, nullptr);

    auto probe = std::make_shared<FakeProbe>(FakeProbe::Mode::reply);
    auto first = manager.on_connection_ready("a", probe);
    auto second = manager.on_connection_ready("b", probe);
    REQUIRE(first->id() != second->id());
    REQUIRE(manager.session_count() == 2);

    manager.shutdown();
    REQUIRE(manager.session_count() == 0);
    REQUIRE(registry->size() == 0);
}

TEST_CASE("Discovery is not issued for a session that already disconnected", "[session]") {
    IoThread io;
    auto registry = std::make_shared<discovery::CapabilityRegistry>(io.context(), nullptr,
                                                                    std::chrono::milliseconds(2000));
    session::ProducerSessionManager manager(registry, nullptr, nullptr);

    auto probe = std::make_shared<FakeProbe>(FakeProbe::Mode::silent, std::vector<std::string>{"svc"});
    auto data = manager.on_connection_ready("10.0.0.7:41000", probe);
    REQUIRE(probe->calls() == 1);
    REQUIRE(registry->pending(data->id()));

    manager.on_disconnect(data->id());
    REQUIRE_FALSE(registry->pending(data->id()));

    REQUIRE_FALSE(manager.discover_capabilities(data->id()));
    REQUIRE(probe->calls() == 1);
    REQUIRE_FALSE(registry->pending(data->id()));

    REQUIRE(probe->respond());
    io.sync();
    REQUIRE(registry->size() == 0);
}

TEST_CASE("A disconnect racing discovery leaves no capability entry", "[session]") {
    IoThread io;
    auto registry = std::make_shared<discovery::CapabilityRegistry>(io.context(), nullptr,
                                                                    std::chrono::milliseconds(2000));
    session::ProducerSessionManager manager(registry, nullptr, nullptr);

    auto probe = std::make_shared<FakeProbe>(FakeProbe::Mode::reply, std::vector<std::string>{"svc"});
    // The producer hangs up while its capabilities are being requested.
    probe->on_call([&manager] {
        for (const auto& context : manager.get_active_sessions()) {
            manager.on_disconnect(context.session_id);
        }
    });

    auto data = manager.on_connection_ready("10.0.0.8:41000", probe);
    REQUIRE(data != nullptr);
    REQUIRE(probe->calls() == 1);
    REQUIRE(manager.session_count() == 0);

    io.sync();
    REQUIRE_FALSE(registry->pending(data->id()));
    REQUIRE_FALSE(registry->find(data->id()).has_value());
    REQUIRE(registry->size() == 0);
}

TEST_CASE("Session manager requires a registry", "[session]") {
    REQUIRE_THROWS_AS(session::ProducerSessionManager(nullptr, nullptr, nullptr), std::invalid_argument);
}
