#pragma once

#include <boost/sml.hpp>
#include <utility>

namespace quill {

// Thin owner of a boost::sml machine. Components derive from this and expose
// only the events they accept.
template <class Model, class... Policies>
class sm {
 public:
  using model_type = Model;
  using state_machine_type = boost::sml::sm<Model, Policies...>;

  sm() = default;
  ~sm() = default;

  sm(const sm &) = default;
  sm(sm &&) = default;
  sm & operator=(const sm &) = default;
  sm & operator=(sm &&) = default;

  template <class... Args>
  explicit sm(Args &&... args) : state_machine_(std::forward<Args>(args)...) {}

  template <class Event>
  bool process_event(const Event & ev) {
    return state_machine_.process_event(ev);
  }

  template <class State>
  bool is(State state = {}) const {
    return state_machine_.is(state);
  }

 private:
  state_machine_type state_machine_;
};

}  // namespace quill
