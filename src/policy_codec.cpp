#include "warden/policy_codec.hpp"
#include "warden/version.hpp"

#include <cmath>
#include <utility>

namespace warden {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

NodeDecodeResult node_error(std::string message) {
  NodeDecodeResult r;
  r.error = std::move(message);
  return r;
}

PolicyDecodeResult policy_error(std::string message) {
  PolicyDecodeResult r;
  r.error = std::move(message);
  return r;
}

NodeDecodeResult decode_node_at(const Value& value, std::size_t depth) {
  if (depth > kMaxPolicyDepth) {
    return node_error("policy nesting exceeds depth " + std::to_string(kMaxPolicyDepth));
  }

  if (const auto* tag = std::get_if<std::string>(&value.v)) {
    NodeDecodeResult r;
    r.ok   = true;
    r.node = condition(*tag);
    return r;
  }

  const auto* obj = std::get_if<Object>(&value.v);
  if (!obj) return node_error("policy node must be a string or an object");

  if (obj->count("operator")) {
    const std::string op = jsonlite::get_string(*obj, "operator");
    const Array* clauses = jsonlite::get_array(*obj, "clauses");
    if (!clauses) return node_error("operator '" + op + "' requires a clauses array");

    std::vector<PolicyNode> children;
    children.reserve(clauses->size());
    for (const auto& c : *clauses) {
      auto child = decode_node_at(c, depth + 1);
      if (!child.ok) return child;
      children.push_back(std::move(child.node));
    }

    NodeDecodeResult r;
    r.ok = true;
    if (op == "AND") {
      r.node = all_of(std::move(children));
    } else if (op == "OR") {
      r.node = any_of(std::move(children));
    } else {
      r.node = PolicyNode{UnknownOperator{op}};
    }
    return r;
  }

  if (obj->count("action") || obj->count("resourceType")) {
    const auto action   = obj->find("action");
    const auto resource = obj->find("resourceType");
    if (action == obj->end() || !std::holds_alternative<std::string>(action->second.v) ||
        resource == obj->end() || !std::holds_alternative<std::string>(resource->second.v)) {
      return node_error("claim requirement needs string action and resourceType");
    }
    NodeDecodeResult r;
    r.ok   = true;
    r.node = require(std::get<std::string>(action->second.v),
                     std::get<std::string>(resource->second.v));
    return r;
  }

  return node_error("unrecognized policy node");
}

PolicyDecodeResult decode_vector(const Object& obj) {
  VectorPolicy policy;

  const Array* dims = jsonlite::get_array(obj, "dimensions");
  if (!dims) return policy_error("vector policy requires a dimensions array");
  for (const auto& d : *dims) {
    VectorDimension dim;
    if (const auto* name = std::get_if<std::string>(&d.v)) {
      dim.name = *name;
    } else if (const auto* dobj = std::get_if<Object>(&d.v)) {
      dim.name = jsonlite::get_string(*dobj, "name");
      const std::string type = jsonlite::get_string(*dobj, "type", "numeric");
      if (type == "categorical") {
        dim.kind = DimensionKind::categorical;
        dim.map  = jsonlite::get_string(*dobj, "map", dim.name);
      } else if (type != "numeric") {
        return policy_error("unknown dimension type '" + type + "'");
      }
    } else {
      return policy_error("dimension must be a string or an object");
    }
    if (dim.name.empty()) return policy_error("dimension requires a name");
    policy.dimensions.push_back(std::move(dim));
  }

  const Array* position = jsonlite::get_array(obj, "position");
  if (!position) return policy_error("vector policy requires a position array");
  for (const auto& p : *position) {
    const auto n = jsonlite::as_number(p);
    if (!n || !std::isfinite(*n)) return policy_error("position entries must be numbers");
    policy.position.push_back(*n);
  }

  const auto threshold = obj.find("threshold");
  if (threshold == obj.end()) return policy_error("vector policy requires a threshold");
  const auto t = jsonlite::as_number(threshold->second);
  if (!t) return policy_error("threshold must be a number");
  policy.threshold = *t;

  PolicyDecodeResult r;
  r.ok     = true;
  r.policy = std::move(policy);
  return r;
}

Value encode_vector(const VectorPolicy& policy) {
  Object o;
  o["kind"] = Value{std::string("vector")};
  o["v"]    = Value{static_cast<uint64_t>(version::POLICY_SCHEMA_VERSION)};

  Array dims;
  for (const auto& d : policy.dimensions) {
    Object dobj;
    dobj["name"] = Value{d.name};
    dobj["type"] = Value{to_string(d.kind)};
    if (d.kind == DimensionKind::categorical) dobj["map"] = Value{d.map};
    dims.push_back(Value{std::move(dobj)});
  }
  o["dimensions"] = Value{std::move(dims)};

  Array position;
  for (double p : policy.position) position.push_back(Value{p});
  o["position"]  = Value{std::move(position)};
  o["threshold"] = Value{policy.threshold};
  return Value{std::move(o)};
}

}  // namespace

NodeDecodeResult decode_node(const Value& value) {
  return decode_node_at(value, 0);
}

Value encode_node(const PolicyNode& node) {
  return std::visit(
      overloaded{
          [](const ClaimMatch& leaf) -> Value {
            Object o;
            o["action"]       = Value{leaf.action};
            o["resourceType"] = Value{leaf.resource_type};
            return Value{std::move(o)};
          },
          [](const ConditionRef& ref) -> Value { return Value{ref.tag}; },
          [](const AllOf& all) -> Value {
            Array clauses;
            for (const auto& c : all.clauses) clauses.push_back(encode_node(c));
            Object o;
            o["operator"] = Value{std::string("AND")};
            o["clauses"]  = Value{std::move(clauses)};
            return Value{std::move(o)};
          },
          [](const AnyOf& any) -> Value {
            Array clauses;
            for (const auto& c : any.clauses) clauses.push_back(encode_node(c));
            Object o;
            o["operator"] = Value{std::string("OR")};
            o["clauses"]  = Value{std::move(clauses)};
            return Value{std::move(o)};
          },
          [](const UnknownOperator& op) -> Value {
            Object o;
            o["operator"] = Value{op.name};
            o["clauses"]  = Value{Array{}};
            return Value{std::move(o)};
          },
      },
      node.v);
}

PolicyDecodeResult decode_policy_value(const Value& value) {
  if (const auto* obj = std::get_if<Object>(&value.v)) {
    // Hand-written policies may omit "v"; a stored one must match this build.
    const auto v = obj->find("v");
    if (v != obj->end() &&
        !(std::holds_alternative<uint64_t>(v->second.v) &&
          std::get<uint64_t>(v->second.v) == version::POLICY_SCHEMA_VERSION)) {
      return policy_error("unsupported policy schema version " + jsonlite::to_json(v->second));
    }
    const std::string kind = jsonlite::get_string(*obj, "kind");
    if (kind == "vector" || (kind.empty() && obj->count("position"))) {
      return decode_vector(*obj);
    }
    if (kind == "boolean") {
      const auto rule = obj->find("rule");
      if (rule == obj->end()) return policy_error("boolean policy requires a rule");
      auto node = decode_node(rule->second);
      if (!node.ok) return policy_error(node.error);
      PolicyDecodeResult r;
      r.ok     = true;
      r.policy = BooleanPolicy{std::move(node.node)};
      return r;
    }
    if (!kind.empty()) return policy_error("unknown policy kind '" + kind + "'");
  }

  auto node = decode_node(value);
  if (!node.ok) return policy_error(node.error);
  PolicyDecodeResult r;
  r.ok     = true;
  r.policy = BooleanPolicy{std::move(node.node)};
  return r;
}

PolicyDecodeResult decode_policy(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const Value value = jsonlite::parse_value(json, &err);
  if (err) return policy_error(err->code + ": " + err->message);
  return decode_policy_value(value);
}

std::string encode_policy(const AccessPolicy& policy) {
  if (const auto* vec = std::get_if<VectorPolicy>(&policy)) {
    return jsonlite::to_json(encode_vector(*vec));
  }
  Object o;
  o["kind"] = Value{std::string("boolean")};
  o["rule"] = encode_node(std::get<BooleanPolicy>(policy).rule);
  o["v"]    = Value{static_cast<uint64_t>(version::POLICY_SCHEMA_VERSION)};
  return jsonlite::to_json(Value{std::move(o)});
}

ClaimsDecodeResult decode_claims_value(const Value& value) {
  ClaimsDecodeResult r;
  const auto* arr = std::get_if<Array>(&value.v);
  if (!arr) {
    r.error = "claims must be an array";
    return r;
  }
  for (const auto& item : *arr) {
    const auto* obj = std::get_if<Object>(&item.v);
    if (!obj) {
      r.error = "claim must be an object";
      return r;
    }
    Claim claim;
    claim.action        = jsonlite::get_string(*obj, "action");
    claim.resource_type = jsonlite::get_string(*obj, "resourceType");
    if (claim.action.empty() || claim.resource_type.empty()) {
      r.error = "claim requires action and resourceType";
      return r;
    }
    const auto cond = obj->find("conditions");
    if (cond != obj->end() && !std::holds_alternative<std::nullptr_t>(cond->second.v)) {
      auto node = decode_node(cond->second);
      if (!node.ok) {
        r.error = "claim conditions: " + node.error;
        return r;
      }
      claim.condition = std::move(node.node);
    }
    r.claims.push_back(std::move(claim));
  }
  r.ok = true;
  return r;
}

ClaimsDecodeResult decode_claims(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const Value value = jsonlite::parse_value(json, &err);
  if (err) {
    ClaimsDecodeResult r;
    r.error = err->code + ": " + err->message;
    return r;
  }
  return decode_claims_value(value);
}

std::string encode_claim(const Claim& claim) {
  Object o;
  o["action"]       = Value{claim.action};
  o["resourceType"] = Value{claim.resource_type};
  if (claim.condition) o["conditions"] = encode_node(*claim.condition);
  return jsonlite::to_json(Value{std::move(o)});
}

VectorMaps decode_vector_maps(const Object& obj) {
  VectorMaps maps;
  for (const auto& [name, table] : obj) {
    const auto* entries = std::get_if<Object>(&table.v);
    if (!entries) continue;
    ValueMap& out = maps[name];
    for (const auto& [category, coordinate] : *entries) {
      if (const auto n = jsonlite::as_number(coordinate)) out[category] = *n;
    }
  }
  return maps;
}

}  // namespace warden
