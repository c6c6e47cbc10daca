#include <iostream>
#include <string>
#include <vector>

#include "access/scan_reader.h"
#include "access/validation_engine.h"
#include "access/verification.h"
#include "cloud/access_logger.h"
#include "config/reader_config.h"
#include "core/console.h"
#include "relay/relay_controller.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

// ---------- shared recorders ----------

std::vector<std::string> trace;
std::vector<uint32_t> pauses;
std::string console;

void captureConsole(const char* text) {
  console += text;
}

void recordPause(uint32_t ms) {
  pauses.push_back(ms);
  trace.push_back("pause");
}

bool consoleHas(const std::string& needle) {
  return console.find(needle) != std::string::npos;
}

void resetRecorders() {
  trace.clear();
  pauses.clear();
  console.clear();
}

// ---------- fakes ----------

class FakeRelayDriver : public RelayDriver {
public:
  bool setupOk = true;
  bool claimed = false;
  bool active = false;
  int writes = 0;
  int setups = 0;
  int cleanups = 0;

  bool setup(uint8_t, bool initialActive) override {
    setups++;
    if (!setupOk) return false;
    claimed = true;
    active = initialActive;
    return true;
  }

  void setOutput(uint8_t, bool on) override {
    active = on;
    writes++;
    trace.push_back(on ? "relay:on" : "relay:off");
  }

  void cleanup() override {
    claimed = false;
    cleanups++;
  }
};

HttpReply replyWith(int code, const std::string& body) {
  HttpReply r;
  r.code = code;
  r.body = body;
  return r;
}

HttpReply transportFailure(int code, const char* error) {
  HttpReply r;
  r.code = code;
  r.error = error;
  return r;
}

class FakeAuthority : public AuthorityClient {
public:
  HttpReply verifyReply;
  HttpReply activateReply;
  HttpReply logReply = replyWith(201, "");

  mutable int verifyCalls = 0;
  mutable int activateCalls = 0;
  mutable int grantedCalls = 0;
  mutable int deniedCalls = 0;
  mutable std::string lastGuestId;

  HttpReply verify(const std::string& uid) const override {
    verifyCalls++;
    trace.push_back("verify:" + uid);
    return verifyReply;
  }

  HttpReply activate(const std::string& uid) const override {
    activateCalls++;
    trace.push_back("activate:" + uid);
    return activateReply;
  }

  HttpReply recordGranted(const std::string& uid, const std::string& guestIdJson) const override {
    grantedCalls++;
    lastGuestId = guestIdJson;
    trace.push_back("post-granted:" + uid);
    return logReply;
  }

  HttpReply recordDenied(const std::string& uid) const override {
    deniedCalls++;
    trace.push_back("post-denied:" + uid);
    return logReply;
  }
};

class RecordingLogger : public AccessLogger {
public:
  std::vector<AccessOutcome> outcomes;

  void record(const AccessOutcome& outcome) override {
    outcomes.push_back(outcome);
    trace.push_back(std::string("log:") + toString(outcome.kind()) + ":" + outcome.uid());
  }
};

// One engine wired to fakes, relay already claimed on pin 25
struct Rig {
  ReaderConfig cfg;
  FakeRelayDriver driver;
  FakeAuthority authority;
  RecordingLogger logger;
  RelayController relay;
  ValidationEngine engine;

  Rig()
  : relay(driver, recordPause),
    engine(cfg, authority, relay, logger) {
    relay.init(cfg.relay_pin);
    resetRecorders();
  }

  int count(const std::vector<uint32_t>& v, uint32_t value) const {
    int n = 0;
    for (size_t i = 0; i < v.size(); ++i) {
      if (v[i] == value) n++;
    }
    return n;
  }

  bool engaged() const { return count(pauses, cfg.unlock_duration_ms) > 0; }

  bool flashed() const {
    return count(pauses, cfg.deny_flash_interval_ms) == 2 * cfg.deny_flash_count;
  }
};

int indexOf(const std::string& entry) {
  for (size_t i = 0; i < trace.size(); ++i) {
    if (trace[i] == entry) return static_cast<int>(i);
  }
  return -1;
}

const char* kActiveWithGuest =
  "{\"success\":true,\"data\":{\"rfid\":{\"status\":\"active\"},"
  "\"guest\":{\"id\":7,\"name\":\"Jo\"}}}";

const char* kAssignedNoGuest =
  "{\"success\":true,\"data\":{\"rfid\":{\"status\":\"assigned\"}}}";

const char* kActivated =
  "{\"success\":true,\"data\":{\"status\":\"active\"}}";

// ---------- validation engine ----------

bool test_active_card_unlocks_and_logs_granted_with_guest() {
  Rig rig;
  rig.authority.verifyReply = replyWith(200, kActiveWithGuest);

  rig.engine.validate("A1");

  CHECK(rig.authority.activateCalls == 0);
  CHECK(pauses.size() == 1);
  CHECK(pauses[0] == 5000);
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(rig.logger.outcomes[0].kind() == AccessKind::GRANTED);
  CHECK(rig.logger.outcomes[0].uid() == "A1");
  CHECK(rig.logger.outcomes[0].guestIdJson() == "7");
  CHECK(consoleHas("Guest Info => ID=7, Name=Jo"));
  CHECK(consoleHas("No room info provided by backend."));
  return true;
}

bool test_assigned_card_is_activated_before_unlock() {
  Rig rig;
  rig.authority.verifyReply = replyWith(200, kAssignedNoGuest);
  rig.authority.activateReply = replyWith(200, kActivated);

  rig.engine.validate("B2");

  CHECK(rig.authority.activateCalls == 1);
  CHECK(indexOf("activate:B2") >= 0);
  CHECK(indexOf("activate:B2") < indexOf("relay:on"));
  CHECK(indexOf("relay:off") < indexOf("log:GRANTED:B2"));
  CHECK(pauses.size() == 1 && pauses[0] == 5000);
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(rig.logger.outcomes[0].kind() == AccessKind::GRANTED);
  CHECK(!rig.logger.outcomes[0].hasGuestId());
  CHECK(consoleHas("successfully activated (status=active)"));
  CHECK(consoleHas("No guest info provided by backend."));

  // no status key in the activation reply still opens, settled as unknown
  resetRecorders();
  rig.authority.activateReply = replyWith(200, "{\"success\":true,\"data\":{}}");
  rig.engine.validate("B3");

  CHECK(rig.authority.activateCalls == 2);
  CHECK(pauses.size() == 1 && pauses[0] == 5000);
  CHECK(rig.logger.outcomes.size() == 2);
  CHECK(rig.logger.outcomes[1].kind() == AccessKind::GRANTED);
  CHECK(consoleHas("successfully activated (status=unknown)"));
  return true;
}

bool test_forbidden_denies_with_backend_message() {
  Rig rig;
  rig.authority.verifyReply = replyWith(403, "{\"message\":\"expired\"}");

  rig.engine.validate("C3");

  CHECK(!rig.engaged());
  CHECK(rig.flashed());
  CHECK(rig.driver.writes == 12);
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(rig.logger.outcomes[0].kind() == AccessKind::DENIED);
  CHECK(rig.logger.outcomes[0].uid() == "C3");
  CHECK(consoleHas("DENIED uid=C3 reason=expired"));
  return true;
}

bool test_verify_timeout_is_inconclusive() {
  Rig rig;
  rig.authority.verifyReply = transportFailure(-11, "read Timeout");

  rig.engine.validate("D4");

  CHECK(pauses.empty());
  CHECK(rig.driver.writes == 0);
  CHECK(rig.logger.outcomes.empty());
  CHECK(rig.authority.activateCalls == 0);
  CHECK(consoleHas("Cannot connect to backend: read Timeout"));
  CHECK(!consoleHas("DENIED"));
  return true;
}

bool test_backend_refusal_denies_with_message_or_default() {
  Rig rig;
  rig.authority.verifyReply = replyWith(200, "{\"success\":false,\"message\":\"Room not checked in\"}");
  rig.engine.validate("E5");

  CHECK(!rig.engaged());
  CHECK(rig.flashed());
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(rig.logger.outcomes[0].kind() == AccessKind::DENIED);
  CHECK(consoleHas("reason=Room not checked in"));

  resetRecorders();
  rig.authority.verifyReply = replyWith(200, "{\"success\":false}");
  rig.engine.validate("E6");

  CHECK(!rig.engaged());
  CHECK(rig.logger.outcomes.size() == 2);
  CHECK(rig.logger.outcomes[1].kind() == AccessKind::DENIED);
  CHECK(consoleHas("reason=Unknown backend error."));
  return true;
}

bool test_unparseable_verify_body_denies() {
  const char* bodies[] = { "<html>502</html>", "[1,2,3]", "" };

  for (size_t i = 0; i < sizeof(bodies) / sizeof(bodies[0]); ++i) {
    Rig rig;
    rig.authority.verifyReply = replyWith(200, bodies[i]);

    rig.engine.validate("F6");

    CHECK(!rig.engaged());
    CHECK(rig.flashed());
    CHECK(rig.logger.outcomes.size() == 1);
    CHECK(rig.logger.outcomes[0].kind() == AccessKind::DENIED);
    CHECK(consoleHas("reason=Backend JSON parse error."));
  }
  return true;
}

bool test_any_activation_failure_denies() {
  HttpReply failures[] = {
    replyWith(500, "{\"success\":false}"),
    replyWith(200, "{\"success\":false,\"message\":\"card revoked\"}"),
    transportFailure(-1, "connection refused"),
    replyWith(200, "not json"),
    replyWith(200, "{\"success\":true,\"data\":{\"status\":null}}"),
  };

  for (size_t i = 0; i < sizeof(failures) / sizeof(failures[0]); ++i) {
    Rig rig;
    rig.authority.verifyReply = replyWith(200, kAssignedNoGuest);
    rig.authority.activateReply = failures[i];

    rig.engine.validate("G7");

    CHECK(rig.authority.activateCalls == 1);
    CHECK(!rig.engaged());
    CHECK(rig.flashed());
    CHECK(rig.logger.outcomes.size() == 1);
    CHECK(rig.logger.outcomes[0].kind() == AccessKind::DENIED);
    CHECK(consoleHas("reason=RFID G7 could not be activated."));
  }
  return true;
}

bool test_not_found_without_detail_and_unexpected_status() {
  Rig rig;
  rig.authority.verifyReply = replyWith(404, "Not Found");
  rig.engine.validate("H8");

  CHECK(rig.flashed());
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(consoleHas("reason=No detail provided"));

  resetRecorders();
  rig.authority.verifyReply = replyWith(500, "{\"message\":\"boom\"}");
  rig.engine.validate("H9");

  CHECK(!rig.engaged());
  CHECK(rig.flashed());
  CHECK(rig.logger.outcomes.size() == 2);
  CHECK(rig.logger.outcomes[1].kind() == AccessKind::DENIED);
  CHECK(consoleHas("reason=Unexpected status 500"));
  return true;
}

bool test_non_assigned_statuses_pass_through_without_activation() {
  const char* bodies[] = {
    "{\"success\":true,\"data\":{\"rfid\":{\"status\":\"unassigned\"}}}",
    "{\"success\":true,\"data\":{\"rfid\":{\"status\":\"suspended\"}}}",
  };

  for (size_t i = 0; i < sizeof(bodies) / sizeof(bodies[0]); ++i) {
    Rig rig;
    rig.authority.verifyReply = replyWith(200, bodies[i]);

    rig.engine.validate("J1");

    CHECK(rig.authority.activateCalls == 0);
    CHECK(rig.engaged());
    CHECK(rig.logger.outcomes.size() == 1);
    CHECK(rig.logger.outcomes[0].kind() == AccessKind::GRANTED);
  }
  return true;
}

bool test_missing_status_is_not_trusted() {
  Rig rig;
  rig.authority.verifyReply = replyWith(200, "{\"success\":true,\"data\":{}}");

  rig.engine.validate("K2");

  CHECK(rig.authority.activateCalls == 0);
  CHECK(!rig.engaged());
  CHECK(rig.logger.outcomes.size() == 1);
  CHECK(rig.logger.outcomes[0].kind() == AccessKind::DENIED);
  return true;
}

bool test_relay_rests_locked_around_every_validation() {
  HttpReply replies[] = {
    replyWith(200, kActiveWithGuest),
    replyWith(403, "{\"message\":\"expired\"}"),
    transportFailure(-11, "read Timeout"),
    replyWith(200, "garbage"),
    replyWith(503, ""),
  };

  Rig rig;
  rig.authority.activateReply = replyWith(200, kActivated);

  for (size_t i = 0; i < sizeof(replies) / sizeof(replies[0]); ++i) {
    CHECK(!rig.driver.active);
    rig.authority.verifyReply = replies[i];
    rig.engine.validate("L3");
    CHECK(!rig.driver.active);
  }
  return true;
}

// ---------- relay ----------

bool test_relay_guard_claims_and_releases_pin() {
  resetRecorders();
  FakeRelayDriver driver;
  RelayController relay(driver, recordPause);

  {
    RelayGuard guard(relay, 25);
    CHECK(guard.isAcquired());
    CHECK(driver.claimed);
    CHECK(!driver.active);

    relay.engage(40);
    CHECK(!driver.active);
    CHECK(pauses.size() == 1 && pauses[0] == 40);
  }

  CHECK(!driver.claimed);
  CHECK(driver.cleanups == 1);
  CHECK(!driver.active);
  CHECK(!relay.isInitialized());
  return true;
}

bool test_relay_locked_at_boot_is_adopted_by_guard() {
  resetRecorders();
  FakeRelayDriver driver;
  RelayController relay(driver, recordPause);

  // boot claims the pin before the access loop exists
  CHECK(relay.init(25));
  CHECK(driver.claimed);
  CHECK(!driver.active);

  {
    RelayGuard guard(relay, 25);
    CHECK(guard.isAcquired());
    CHECK(driver.setups == 1);
    CHECK(driver.cleanups == 0);
  }

  CHECK(!driver.claimed);
  CHECK(driver.cleanups == 1);
  CHECK(!driver.active);
  return true;
}

bool test_relay_guard_reports_failed_claim() {
  resetRecorders();
  FakeRelayDriver driver;
  driver.setupOk = false;
  RelayController relay(driver, recordPause);

  {
    RelayGuard guard(relay, 34);
    CHECK(!guard.isAcquired());

    relay.engage(5000);
    relay.signalDenial(6, 150);
    CHECK(driver.writes == 0);
    CHECK(pauses.empty());
  }

  CHECK(driver.cleanups == 0);
  CHECK(consoleHas("could not claim pin 34"));
  return true;
}

bool test_denial_flash_toggles_and_ends_locked() {
  resetRecorders();
  FakeRelayDriver driver;
  RelayController relay(driver, recordPause);
  CHECK(relay.init(25));

  relay.signalDenial(2, 150);

  std::vector<std::string> expected;
  expected.push_back("relay:on");
  expected.push_back("pause");
  expected.push_back("relay:off");
  expected.push_back("pause");
  expected.push_back("relay:on");
  expected.push_back("pause");
  expected.push_back("relay:off");
  expected.push_back("pause");

  CHECK(trace == expected);
  CHECK(pauses.size() == 4);
  CHECK(pauses[0] == 150 && pauses[3] == 150);
  CHECK(!driver.active);
  return true;
}

// ---------- log delivery ----------

bool test_log_delivery_succeeds_only_on_created() {
  resetRecorders();
  FakeAuthority authority;

  CHECK(deliverAccessLog(authority, AccessOutcome::granted("M1", "7")));
  CHECK(authority.grantedCalls == 1);
  CHECK(authority.lastGuestId == "7");
  CHECK(consoleHas("Access granted logged successfully."));

  CHECK(deliverAccessLog(authority, AccessOutcome::denied("M2")));
  CHECK(authority.deniedCalls == 1);
  CHECK(consoleHas("Access denied logged successfully."));

  authority.logReply = replyWith(200, "{}");
  CHECK(!deliverAccessLog(authority, AccessOutcome::denied("M3")));
  CHECK(consoleHas("Logging failed: HTTP 200"));

  authority.logReply = transportFailure(-4, "not connected");
  CHECK(!deliverAccessLog(authority, AccessOutcome::granted("M4", "")));
  CHECK(consoleHas("Logging request failed for M4: not connected"));
  CHECK(authority.grantedCalls == 2);
  CHECK(authority.deniedCalls == 2);
  return true;
}

// ---------- parsing ----------

bool test_verify_parse_keeps_room_and_guest_fields_as_sent() {
  VerificationResult r;
  std::string error;
  const std::string body =
    "{\"success\":true,\"message\":\"ok\",\"data\":{"
    "\"rfid\":{\"status\":\"assigned\"},"
    "\"guest\":{\"id\":\"g-7\",\"name\":\"Jo\"},"
    "\"room\":{\"id\":3,\"room_number\":101,\"status\":\"occupied\","
    "\"check_in\":\"2026-10-01\",\"check_out\":\"2026-10-05\"}}}";

  CHECK(Verification::parseVerify(body, r, error));
  CHECK(r.success);
  CHECK(r.hasMessage && r.message == "ok");
  CHECK(r.hasStatus && r.status == CredentialStatus::ASSIGNED);
  CHECK(r.guest.present);
  CHECK(r.guest.idJson == "\"g-7\"");
  CHECK(r.room.present);
  CHECK(r.room.id == "3");
  CHECK(r.room.number == "101");
  CHECK(r.room.checkOut == "2026-10-05");

  CHECK(!Verification::parseVerify("{\"success\":tru", r, error));
  CHECK(!error.empty());

  std::string message;
  CHECK(!Verification::parseDenialMessage("{\"error\":\"x\"}", message));
  CHECK(Verification::parseDenialMessage("{\"message\":\"expired\"}", message));
  CHECK(message == "expired");
  return true;
}

// ---------- scan input ----------

ScanEvent feedAll(ScanReader& reader, const std::string& bytes) {
  ScanEvent last = ScanEvent::NONE;
  for (size_t i = 0; i < bytes.size(); ++i) {
    ScanEvent e = reader.feed(bytes[i]);
    if (e != ScanEvent::NONE) last = e;
  }
  return last;
}

bool test_scan_reader_trims_lines_and_skips_blanks() {
  resetRecorders();
  ScanReader reader(16);

  CHECK(feedAll(reader, "  04A1B2C3 \r") == ScanEvent::LINE);
  CHECK(reader.line() == "04A1B2C3");
  CHECK(reader.feed('\n') == ScanEvent::NONE);

  CHECK(feedAll(reader, "   \n\n") == ScanEvent::NONE);

  CHECK(feedAll(reader, "0123456789ABCDEFXYZ\n") == ScanEvent::NONE);
  CHECK(consoleHas("discarding line"));
  CHECK(feedAll(reader, "B2\n") == ScanEvent::LINE);
  CHECK(reader.line() == "B2");
  return true;
}

bool test_scan_reader_accepts_exactly_max_length() {
  resetRecorders();
  ScanReader reader(16);

  CHECK(feedAll(reader, "0123456789ABCDEF\n") == ScanEvent::LINE);
  CHECK(reader.line() == "0123456789ABCDEF");
  CHECK(!consoleHas("discarding line"));

  CHECK(feedAll(reader, "0123456789ABCDEFG\n") == ScanEvent::NONE);
  CHECK(consoleHas("discarding line"));
  CHECK(reader.line() == "0123456789ABCDEF");
  return true;
}

bool test_scan_reader_interrupt_discards_partial_line() {
  ScanReader reader(16);

  CHECK(feedAll(reader, "A1") == ScanEvent::NONE);
  CHECK(reader.feed(ScanReader::INTERRUPT_CHAR) == ScanEvent::INTERRUPT);
  CHECK(feedAll(reader, "C3\n") == ScanEvent::LINE);
  CHECK(reader.line() == "C3");
  return true;
}

} // namespace

int main() {
  Console::init(captureConsole);

  bool ok = true;

  ok &= test_active_card_unlocks_and_logs_granted_with_guest();
  ok &= test_assigned_card_is_activated_before_unlock();
  ok &= test_forbidden_denies_with_backend_message();
  ok &= test_verify_timeout_is_inconclusive();
  ok &= test_backend_refusal_denies_with_message_or_default();
  ok &= test_unparseable_verify_body_denies();
  ok &= test_any_activation_failure_denies();
  ok &= test_not_found_without_detail_and_unexpected_status();
  ok &= test_non_assigned_statuses_pass_through_without_activation();
  ok &= test_missing_status_is_not_trusted();
  ok &= test_relay_rests_locked_around_every_validation();
  ok &= test_relay_guard_claims_and_releases_pin();
  ok &= test_relay_locked_at_boot_is_adopted_by_guard();
  ok &= test_relay_guard_reports_failed_claim();
  ok &= test_denial_flash_toggles_and_ends_locked();
  ok &= test_log_delivery_succeeds_only_on_created();
  ok &= test_verify_parse_keeps_room_and_guest_fields_as_sent();
  ok &= test_scan_reader_trims_lines_and_skips_blanks();
  ok &= test_scan_reader_accepts_exactly_max_length();
  ok &= test_scan_reader_interrupt_discards_partial_line();

  if (!ok) return 1;

  std::cout << "native_flow tests passed\n";
  return 0;
}
