#pragma once

#include "quill/renderer/actions.hpp"
#include "quill/renderer/events.hpp"
#include "quill/renderer/guards.hpp"
#include "quill/sm.hpp"

namespace quill::renderer {

struct initialized {};
struct rendering {};
struct render_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * renderer orchestration model.
 *
 * Walks the top-level nodes of a program in order; nested blocks are rendered
 * depth-first by `detail::render_node`. Every tag goes through the tag
 * dispatch machine owned by the context, so one tag's handoff completes
 * before the next node starts.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a render request.
 * - `rendering`: render one top-level node per step until done or failed.
 * - `render_decision`: branch on the accumulated result.
 * - `done`/`errored`: terminal outcomes.
 * - `unexpected`: sequencing contract violation.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::render>[guard::valid_render] /
                action::begin_render = sml::state<rendering>,
        sml::state<initialized> + sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<errored>,

        sml::state<done> + sml::event<event::render>[guard::valid_render] /
                action::begin_render = sml::state<rendering>,
        sml::state<done> + sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<errored>,

        sml::state<errored> + sml::event<event::render>[guard::valid_render] /
                action::begin_render = sml::state<rendering>,
        sml::state<errored> + sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::render>[guard::valid_render] /
                action::begin_render = sml::state<rendering>,
        sml::state<unexpected> + sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<unexpected>,

        sml::state<rendering>[guard::phase_failed{}] = sml::state<render_decision>,
        sml::state<rendering>[guard::has_node_work{}] / action::render_next_node =
            sml::state<rendering>,
        sml::state<rendering>[guard::no_node_work{}] = sml::state<render_decision>,

        sml::state<render_decision>[guard::phase_ok{}] / action::finalize_done =
            sml::state<done>,
        sml::state<render_decision>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<rendering> + sml::unexpected_event<sml::_> / action::on_unexpected =
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

}  // namespace quill::renderer
