// tests/test_identity_bootstrapper.cpp
//
// Goals:
//  - The backend is initialized at most once per process; repeated
//    Bootstrap() calls only check state.
//  - Failures never escape: they are logged and reported as false.
//  - Sign-in is anonymous and only happens when no session exists.

#include <doctest/doctest.h>

#include "identity/IdentityBootstrapper.h"
#include "test_support/FakeIdentityBackend.h"
#include "test_support/TestLogging.h"

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace twinboot;
using namespace twinboot::identity;
using twinboot::test::FakeIdentityBackend;
using twinboot::test::MakeCapturedLog;

namespace {

class LabelDetector final : public ISiblingDetector {
public:
    explicit LabelDetector(std::string label) : m_label(std::move(label)) {}
    std::string Name() const override { return "scripted"; }
    bool IsSecondaryInstance() const override { return true; }
    std::string Label() const override { return m_label; }

private:
    std::string m_label;
};

// Bundles the pieces a bootstrapper borrows so each test owns them.
struct Rig {
    FakeIdentityBackend backend;
    twinboot::test::CapturedLog log = MakeCapturedLog("identity");
    SecondaryInstanceFlag flag;
    SignalCollector collector;
    IdentityBootstrapper boot;

    explicit Rig(SignalCollectorOptions options = {}, std::vector<std::string> args = {})
        : collector(options, std::move(args), log.logger)
        , boot(backend, collector, flag, log.logger, "staging")
    {
    }
};

SignalCollectorOptions Host()
{
    SignalCollectorOptions o;
    o.runningInHost = true;
    return o;
}

} // namespace

TEST_CASE("Bootstrap initializes with the composed profile and signs in anonymously")
{
    Rig r(SignalCollectorOptions{}, {"PlayerArg:42"});

    CHECK(r.boot.State() == BootstrapState::Uninitialized);
    CHECK(r.boot.Bootstrap());

    CHECK(r.backend.configureCalls == 1);
    CHECK(r.backend.configuredProfile == "Player42");
    CHECK(r.backend.initializeCalls == 1);
    CHECK(r.backend.lastOptions.profile == "Player42");
    CHECK(r.backend.lastOptions.environment == "staging");
    CHECK(r.backend.signInCalls == 1);

    CHECK(r.boot.State() == BootstrapState::Initialized);
    CHECK(r.boot.IsAuthenticated());
    CHECK(r.boot.Profile() == "Player42");
    REQUIRE(r.boot.Session().SessionId());
    CHECK(*r.boot.Session().SessionId() == "player-0001");

    const auto res = r.boot.LastResult();
    CHECK(res.ok());
    CHECK(res.initializedNow);
    CHECK(res.signedInNow);
    CHECK(r.log.Contains("Signing in with profile Player42"));
}

TEST_CASE("Host clone composes Editor + label, sanitized")
{
    Rig r(Host());
    r.collector.AddDetector(std::make_unique<LabelDetector>(" Clone#1"));

    CHECK(r.boot.Bootstrap());
    CHECK(r.backend.configuredProfile == "EditorClone1");
    CHECK(r.flag.IsSet());
}

TEST_CASE("Second Bootstrap call does not initialize again")
{
    Rig r;
    REQUIRE(r.boot.Bootstrap());
    REQUIRE(r.boot.Bootstrap());

    CHECK(r.backend.initializeCalls == 1);
    CHECK(r.backend.configureCalls == 1);
    CHECK(r.backend.signInCalls == 1);

    const auto res = r.boot.LastResult();
    CHECK(res.ok());
    CHECK_FALSE(res.initializedNow);
    CHECK_FALSE(res.signedInNow);
}

TEST_CASE("Initialized but signed-out backend gets a fresh anonymous sign-in")
{
    Rig r;
    REQUIRE(r.boot.Bootstrap());
    r.backend.signedIn = false;

    CHECK(r.boot.Bootstrap());
    CHECK(r.backend.initializeCalls == 1);
    CHECK(r.backend.signInCalls == 2);
}

TEST_CASE("AlreadyInitialized from the backend is treated as success")
{
    Rig r;
    r.backend.reportAlreadyInitialized = true;

    CHECK(r.boot.Bootstrap());
    CHECK(r.boot.State() == BootstrapState::Initialized);
    CHECK_FALSE(r.boot.LastResult().initializedNow);
    CHECK(r.log.Count("[error]") == 0);
}

TEST_CASE("AlreadyInitialized while configuring the profile is treated as success")
{
    // Another owner initializes the shared backend between the
    // IsInitialized() check and ConfigureProfile().
    Rig r;
    r.backend.initializedByOtherOwner = true;
    r.backend.configureError = BackendError(BackendErrorCode::AlreadyInitialized, "profile is locked");

    CHECK(r.boot.Bootstrap());
    CHECK(r.boot.State() == BootstrapState::Initialized);
    CHECK(r.backend.configureCalls == 1);
    CHECK(r.backend.initializeCalls == 0);
    CHECK(r.backend.signInCalls == 1);
    CHECK_FALSE(r.boot.LastResult().initializedNow);
    CHECK(r.boot.IsAuthenticated());
    CHECK(r.log.Count("[error]") == 0);
}

TEST_CASE("Initialization failure is logged and reported as false")
{
    Rig r;
    r.backend.initializeError = BackendError(BackendErrorCode::SignInRejected, "service said no");

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.State() == BootstrapState::Failed);
    CHECK_FALSE(r.boot.IsAuthenticated());
    CHECK_FALSE(r.boot.Session().HasSession());
    CHECK(r.backend.signInCalls == 0);

    const auto res = r.boot.LastResult();
    CHECK(res.failure == BootstrapFailure::InitializeFailed);
    CHECK(res.message.find("service said no") != std::string::npos);
    CHECK(r.log.Contains("Error during authentication (InitializeFailed, during backend initialization)"));
}

TEST_CASE("Non-backend exceptions from initialization are contained too")
{
    Rig r;
    r.backend.initializeException = std::make_exception_ptr(std::runtime_error("socket closed"));

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.LastResult().failure == BootstrapFailure::InitializeFailed);
    CHECK(r.boot.LastResult().message == "socket closed");
    CHECK(r.log.Contains("during backend initialization"));
    CHECK_FALSE(r.log.Contains("during profile composition"));
}

TEST_CASE("Unavailable backend maps to BackendUnavailable")
{
    Rig r;
    r.backend.initializeError = BackendError(BackendErrorCode::Unavailable, "offline");

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.LastResult().failure == BootstrapFailure::BackendUnavailable);
}

TEST_CASE("Profile rejected by the backend maps to MalformedProfile")
{
    Rig r;
    r.backend.configureError = BackendError(BackendErrorCode::InvalidProfile, "too long");

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.LastResult().failure == BootstrapFailure::MalformedProfile);
    CHECK(r.backend.initializeCalls == 0);
}

TEST_CASE("Sign-in failure leaves the backend initialized and the bootstrap failed")
{
    Rig r;
    r.backend.signInError = BackendError(BackendErrorCode::SignInRejected, "banned");

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.State() == BootstrapState::Failed);
    CHECK(r.backend.initialized);
    CHECK_FALSE(r.boot.IsAuthenticated());
    CHECK(r.boot.LastResult().failure == BootstrapFailure::SignInFailed);

    SUBCASE("retry after the backend recovers skips initialization")
    {
        r.backend.signInError.reset();
        CHECK(r.boot.Bootstrap());
        CHECK(r.backend.initializeCalls == 1);
        CHECK(r.backend.signInCalls == 2);
        CHECK(r.boot.State() == BootstrapState::Initialized);
    }
}

TEST_CASE("Empty session id after sign-in is a failure")
{
    Rig r;
    r.backend.sessionIdToIssue.clear();

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.LastResult().failure == BootstrapFailure::SignInFailed);
    CHECK_FALSE(r.boot.Session().HasSession());
}

TEST_CASE("A failed re-bootstrap clears the cached session id")
{
    Rig r;
    REQUIRE(r.boot.Bootstrap());
    REQUIRE(r.boot.Session().HasSession());

    r.backend.signedIn = false;
    r.backend.signInError = BackendError(BackendErrorCode::SignInRejected, "expired");

    CHECK_FALSE(r.boot.Bootstrap());
    CHECK(r.boot.State() == BootstrapState::Failed);
    CHECK_FALSE(r.boot.IsAuthenticated());
    CHECK_FALSE(r.boot.Session().SessionId().has_value());
}

TEST_CASE("IsAuthenticated before any bootstrap is false, not an error")
{
    Rig r;
    CHECK_FALSE(r.boot.IsAuthenticated());
    CHECK(r.backend.isSignedInCalls == 1);
    CHECK(r.log.Count("[error]") == 0);
}

TEST_CASE("BootstrapAsync runs the same attempt")
{
    Rig r(SignalCollectorOptions{}, {"PlayerArg:9"});

    std::future<bool> f = r.boot.BootstrapAsync();
    CHECK(f.get());
    CHECK(r.backend.configuredProfile == "Player9");
    CHECK(r.boot.State() == BootstrapState::Initialized);
}

TEST_CASE("Concurrent Bootstrap calls initialize exactly once")
{
    Rig r;

    auto a = r.boot.BootstrapAsync();
    auto b = r.boot.BootstrapAsync();
    CHECK(a.get());
    CHECK(b.get());
    CHECK(r.backend.initializeCalls == 1);
}
