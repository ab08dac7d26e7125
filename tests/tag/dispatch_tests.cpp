#include <cstdint>
#include <string>
#include <vector>

#include <boost/sml.hpp>
#include <doctest/doctest.h>

#include "quill/quill.h"
#include "quill/tag/sm.hpp"
#include "support/fake_runtime.hpp"

namespace {

struct dispatch_result {
  int32_t err = QUILL_OK;
  std::string message;
  quill::handle::reclaim_path reclaim = quill::handle::reclaim_path::none;
  std::string output;
};

dispatch_result dispatch(quill::tag::sm & machine, const quill::tag::definition & def,
                         quill::store::context * slot,
                         const std::vector<quill::store::value> * args = nullptr) {
  dispatch_result result{};
  machine.process_event(quill::tag::event::render_tag{
    .tag = &def,
    .args = args,
    .slot = slot,
    .output = &result.output,
    .error_out = &result.err,
    .error_message_out = &result.message,
    .reclaim_out = &result.reclaim,
  });
  return result;
}

// Plain tag: echoes its first argument with a fixed prefix.
bool echo_script(quill::tag::foreign_call & call, quill::test::scripted_tag &) {
  call.fragment = "echo:";
  if (call.args != nullptr && !call.args->empty()) {
    call.fragment += (*call.args)[0].string_v;
  }
  return true;
}

// Consuming tag: reads `timezone`, writes `rendered_at`.
bool stamp_script(quill::tag::foreign_call & call, quill::test::scripted_tag &) {
  quill::store::value tz;
  if (!quill::handle::get(call.handle, "timezone", tz)) {
    call.error_message = "KeyError: 'timezone'";
    return false;
  }
  quill::handle::set(call.handle, "rendered_at", quill::store::make_string("12:00 " + tz.string_v));
  call.fragment = "stamped";
  return true;
}

TEST_CASE("tag_dispatch_plain_tag_leaves_context_untouched") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{.script = echo_script};
  const quill::tag::definition def = fake.define("echo", false);

  quill::store::context slot{};
  quill::store::set(slot, "x", quill::store::make_int(1));
  const std::vector<quill::store::value> args = {quill::store::make_string("hi")};

  const dispatch_result result = dispatch(machine, def, &slot, &args);
  CHECK(result.err == QUILL_OK);
  CHECK(result.output == "echo:hi");
  CHECK(result.reclaim == quill::handle::reclaim_path::none);
  CHECK(quill::store::visible_names(slot).size() == 1);
  CHECK(quill::store::find(slot, "x")->int_v == 1);
  CHECK(machine.is(boost::sml::state<quill::tag::done>));
  CHECK(ctx.context_invocations == 0);
}

TEST_CASE("tag_dispatch_plain_tag_is_idempotent") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{.script = echo_script};
  const quill::tag::definition def = fake.define("echo", false);
  const std::vector<quill::store::value> args = {quill::store::make_string("same")};

  const dispatch_result first = dispatch(machine, def, nullptr, &args);
  const dispatch_result second = dispatch(machine, def, nullptr, &args);
  CHECK(first.output == second.output);
  CHECK(fake.calls == 2);
  CHECK(ctx.invocations == 2);
}

TEST_CASE("tag_dispatch_consuming_tag_reclaims_unique_with_mutations") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{.script = stamp_script};
  const quill::tag::definition def = fake.define("stamp", true);

  quill::store::context slot{};
  quill::store::set(slot, "timezone", quill::store::make_string("UTC"));

  const dispatch_result result = dispatch(machine, def, &slot);
  CHECK(result.err == QUILL_OK);
  CHECK(result.output == "stamped");
  CHECK(result.reclaim == quill::handle::reclaim_path::unique);
  CHECK(quill::store::find(slot, "timezone")->string_v == "UTC");
  CHECK(quill::store::find(slot, "rendered_at")->string_v == "12:00 UTC");
  CHECK_FALSE(quill::store::is_placeholder(slot));
  CHECK(ctx.unique_reclaims == 1);
  CHECK(ctx.deep_copy_reclaims == 0);
}

TEST_CASE("tag_dispatch_callee_sees_call_site_and_own_reference") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{};
  const quill::tag::definition def = fake.define("peek", true);

  quill::store::context slot{};
  quill::store::set(slot, "x", quill::store::make_int(1));
  dispatch(machine, def, &slot);
  REQUIRE(fake.use_counts_seen.size() == 1);
  CHECK(fake.use_counts_seen[0] == 2);
}

TEST_CASE("tag_dispatch_retained_handle_deep_copies_and_stays_isolated") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{
    .script =
      [](quill::tag::foreign_call & call, quill::test::scripted_tag & self) {
        self.retained.push_back(call.handle);
        quill::handle::set(call.handle, "seen", quill::store::make_bool(true));
        call.fragment = "kept";
        return true;
      },
  };
  const quill::tag::definition def = fake.define("keep", true);

  quill::test::fake_object object{.label = "obj"};
  quill::store::context slot{};
  quill::store::set(slot, "o", quill::test::make_fake(object));
  quill::store::set(slot, "x", quill::store::make_int(1));

  const dispatch_result result = dispatch(machine, def, &slot);
  CHECK(result.err == QUILL_OK);
  CHECK(result.reclaim == quill::handle::reclaim_path::deep_copy);
  CHECK(quill::store::find(slot, "seen")->bool_v);
  CHECK(object.refs.load() == 2);
  CHECK(ctx.deep_copy_reclaims == 1);

  REQUIRE(fake.retained.size() == 1);
  CHECK(quill::handle::use_count(fake.retained[0]) == 1);

  quill::store::set(slot, "x", quill::store::make_int(2));
  quill::store::value later;
  REQUIRE(quill::handle::get(fake.retained[0], "x", later));
  CHECK(later.int_v == 1);

  fake.retained.clear();
  CHECK(object.refs.load() == 1);
}

TEST_CASE("tag_dispatch_failure_still_reclaims_partial_mutation") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{
    .script =
      [](quill::tag::foreign_call & call, quill::test::scripted_tag &) {
        quill::handle::set(call.handle, "partial", quill::store::make_int(1));
        call.fragment = "never written";
        call.error_message = "ValueError: boom";
        return false;
      },
  };
  const quill::tag::definition def = fake.define("boom", true);

  quill::store::context slot{};
  quill::store::set(slot, "x", quill::store::make_int(1));

  const dispatch_result result = dispatch(machine, def, &slot);
  CHECK(result.err == QUILL_ERR_FOREIGN_CALL);
  CHECK(result.message == "ValueError: boom");
  CHECK(result.output.empty());
  CHECK(result.reclaim == quill::handle::reclaim_path::unique);
  CHECK(quill::store::find(slot, "partial")->int_v == 1);
  CHECK(quill::store::find(slot, "x")->int_v == 1);
  CHECK(machine.is(boost::sml::state<quill::tag::errored>));
  CHECK(ctx.failures == 1);
}

TEST_CASE("tag_dispatch_recovers_after_failure") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag failing{
    .script =
      [](quill::tag::foreign_call & call, quill::test::scripted_tag &) {
        call.error_message = "RuntimeError: nope";
        return false;
      },
  };
  quill::test::scripted_tag echo{.script = echo_script};
  const quill::tag::definition bad = failing.define("bad", false);
  const quill::tag::definition good = echo.define("echo", false);

  CHECK(dispatch(machine, bad, nullptr).err == QUILL_ERR_FOREIGN_CALL);
  const dispatch_result next = dispatch(machine, good, nullptr);
  CHECK(next.err == QUILL_OK);
  CHECK(next.output == "echo:");
  CHECK(machine.is(boost::sml::state<quill::tag::done>));
}

TEST_CASE("tag_dispatch_rejects_invalid_requests_without_invoking") {
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{};
  const quill::tag::definition consuming = fake.define("consume", true);
  quill::tag::definition no_invoke = fake.define("broken", false);
  no_invoke.invoke = {};

  CHECK(dispatch(machine, consuming, nullptr).err == QUILL_ERR_INVALID_ARGUMENT);
  CHECK(dispatch(machine, no_invoke, nullptr).err == QUILL_ERR_INVALID_ARGUMENT);

  int32_t err = QUILL_OK;
  machine.process_event(quill::tag::event::render_tag{
    .tag = nullptr,
    .error_out = &err,
  });
  CHECK(err == QUILL_ERR_INVALID_ARGUMENT);

  std::string output;
  const std::vector<quill::store::value> too_many(quill::tag::k_max_tag_args + 1);
  const quill::tag::definition plain = fake.define("plain", false);
  err = QUILL_OK;
  machine.process_event(quill::tag::event::render_tag{
    .tag = &plain,
    .args = &too_many,
    .output = &output,
    .error_out = &err,
  });
  CHECK(err == QUILL_ERR_INVALID_ARGUMENT);

  CHECK(fake.calls == 0);
  CHECK(machine.is(boost::sml::state<quill::tag::errored>));
}

TEST_CASE("tag_dispatch_runs_done_and_error_callbacks") {
  struct observer {
    int32_t done = 0;
    int32_t errors = 0;
    size_t length = 0;
    quill::handle::reclaim_path reclaim = quill::handle::reclaim_path::none;

    bool on_done(const quill::tag::events::tag_done & ev) noexcept {
      done += 1;
      length = ev.fragment_length;
      reclaim = ev.reclaim;
      return true;
    }

    bool on_error(const quill::tag::events::tag_error &) noexcept {
      errors += 1;
      return true;
    }
  };

  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  quill::test::scripted_tag fake{.script = stamp_script};
  const quill::tag::definition def = fake.define("stamp", true);
  observer seen{};

  quill::store::context slot{};
  quill::store::set(slot, "timezone", quill::store::make_string("CET"));
  std::string output;
  machine.process_event(quill::tag::event::render_tag{
    .tag = &def,
    .slot = &slot,
    .output = &output,
    .dispatch_done =
      quill::callback<bool(const quill::tag::events::tag_done &)>::from<observer,
                                                                     &observer::on_done>(&seen),
    .dispatch_error =
      quill::callback<bool(const quill::tag::events::tag_error &)>::from<observer,
                                                                      &observer::on_error>(
        &seen),
  });
  CHECK(seen.done == 1);
  CHECK(seen.errors == 0);
  CHECK(seen.length == output.size());
  CHECK(seen.reclaim == quill::handle::reclaim_path::unique);
}

}  // namespace
