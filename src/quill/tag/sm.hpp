#pragma once

#include "quill/sm.hpp"
#include "quill/tag/actions.hpp"
#include "quill/tag/events.hpp"
#include "quill/tag/guards.hpp"

namespace quill::tag {

struct initialized {};
struct selecting {};
struct escrowed {};
struct invoked {};
struct reclaimed {};
struct render_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * tag dispatch orchestration model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a tag invocation.
 * - `selecting`: choose the plain or context-consuming path fixed by the definition.
 * - `escrowed`: the slot holds its placeholder; the context lives in a fresh handle.
 * - `invoked`: the callable has returned, successfully or not.
 * - `reclaimed`: an owned context has been recovered from the handle.
 * - `render_decision`: branch on the invocation result.
 * - `done`/`errored`: terminal outcomes for one invocation.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_render_tag`/`invalid_render_tag` validate the request.
 * - `takes_context`/`plain_call` read the registration-time mode.
 * - `phase_*` observe the invocation result.
 *
 * action side effects:
 * - `escrow_context` takes the slot and wraps it; `invoke_*` call the runtime.
 * - `reclaim_context`/`restore_context` run unconditionally after the call, so
 *   the slot is restored before any outcome is reported.
 * - `finalize_*` append the fragment or report the error.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::render_tag>[guard::valid_render_tag] /
                action::begin_dispatch = sml::state<selecting>,
        sml::state<initialized> + sml::event<event::render_tag>[guard::invalid_render_tag] /
                action::reject_invalid_render_tag = sml::state<errored>,

        sml::state<done> + sml::event<event::render_tag>[guard::valid_render_tag] /
                action::begin_dispatch = sml::state<selecting>,
        sml::state<done> + sml::event<event::render_tag>[guard::invalid_render_tag] /
                action::reject_invalid_render_tag = sml::state<errored>,

        sml::state<errored> + sml::event<event::render_tag>[guard::valid_render_tag] /
                action::begin_dispatch = sml::state<selecting>,
        sml::state<errored> + sml::event<event::render_tag>[guard::invalid_render_tag] /
                action::reject_invalid_render_tag = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::render_tag>[guard::valid_render_tag] /
                action::begin_dispatch = sml::state<selecting>,
        sml::state<unexpected> + sml::event<event::render_tag>[guard::invalid_render_tag] /
                action::reject_invalid_render_tag = sml::state<unexpected>,

        sml::state<selecting>[guard::takes_context{}] / action::escrow_context =
            sml::state<escrowed>,
        sml::state<selecting>[guard::plain_call{}] / action::invoke_plain =
            sml::state<render_decision>,

        sml::state<escrowed> / action::invoke_with_context = sml::state<invoked>,
        sml::state<invoked> / action::reclaim_context = sml::state<reclaimed>,
        sml::state<reclaimed> / action::restore_context = sml::state<render_decision>,

        sml::state<render_decision>[guard::phase_ok{}] / action::finalize_done =
            sml::state<done>,
        sml::state<render_decision>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<selecting> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<escrowed> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<invoked> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<reclaimed> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<render_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>);
  }
};

struct sm : public quill::sm<model> {
  using base_type = quill::sm<model>;
  using base_type::base_type;
  using base_type::process_event;
};

}  // namespace quill::tag
