#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quill/store/context.hpp"
#include "quill/store/value.hpp"

namespace quill::renderer {

enum class node_kind : uint8_t {
  text = 0,
  variable = 1,
  tag = 2,
  block = 3
};

// A tag argument: either a literal or a name resolved against the context
// right before the tag runs.
struct argument {
  bool is_variable = false;
  std::string name = {};
  store::value literal = {};
};

struct node {
  node_kind kind = node_kind::text;
  std::string text = {};
  std::vector<argument> args = {};
  std::vector<store::entry> bindings = {};
  std::vector<node> body = {};
};

struct program {
  std::vector<node> body = {};
};

inline argument literal(store::value v) {
  argument out;
  out.literal = std::move(v);
  return out;
}

inline argument variable(std::string_view name) {
  argument out;
  out.is_variable = true;
  out.name.assign(name.data(), name.size());
  return out;
}

inline node text_node(std::string_view text) {
  node out;
  out.kind = node_kind::text;
  out.text.assign(text.data(), text.size());
  return out;
}

inline node variable_node(std::string_view name) {
  node out;
  out.kind = node_kind::variable;
  out.text.assign(name.data(), name.size());
  return out;
}

inline node tag_node(std::string_view name, std::vector<argument> args = {}) {
  node out;
  out.kind = node_kind::tag;
  out.text.assign(name.data(), name.size());
  out.args = std::move(args);
  return out;
}

inline node block_node(std::vector<store::entry> bindings, std::vector<node> body) {
  node out;
  out.kind = node_kind::block;
  out.bindings = std::move(bindings);
  out.body = std::move(body);
  return out;
}

}  // namespace quill::renderer
