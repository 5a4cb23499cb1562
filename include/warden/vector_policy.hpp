#pragma once

// warden/vector_policy.hpp — Continuous (cosine-similarity) policy evaluation.
//
// A resource declaring a vector policy carries a target position in an
// attribute space plus a similarity threshold. The caller's position is
// projected from ambient attributes, one coordinate per declared dimension.
//
// ADMINISTRATIVE CONTRACT:
//   The evaluator is order- and scale-sensitive. Dimension order, the meaning of
//   each coordinate and the numeric values in every named value map must stay
//   stable across resource updates. Reordering dimensions or remapping a
//   category silently changes what every previously written policy grants; the
//   evaluator has no way to detect it.

#include <map>
#include <string>
#include <vector>

#include "warden/policy.hpp"

namespace warden {

enum class DimensionKind { numeric, categorical };

std::string to_string(DimensionKind kind);

struct VectorDimension {
  std::string name;                        // ambient attribute name
  DimensionKind kind{DimensionKind::numeric};
  std::string map;                         // value map name, categorical only
};

struct VectorPolicy {
  std::vector<VectorDimension> dimensions;
  std::vector<double> position;
  double threshold{1.0};
};

// Named category → coordinate tables, e.g. {"role": {"admin": 3, "viewer": 1}}.
using ValueMap   = std::map<std::string, double>;
using VectorMaps = std::map<std::string, ValueMap>;

// 0 when either vector has zero magnitude or the lengths differ.
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

struct ProjectionResult {
  bool ok{false};
  std::vector<double> vector;
  std::string error;
};

ProjectionResult project_context(const std::vector<VectorDimension>& dimensions,
                                 const std::map<std::string, AttributeValue>& attributes,
                                 const VectorMaps& maps);

struct VectorResult {
  bool met{false};
  bool malformed{false};
  double similarity{0.0};
  std::string reason;
};

VectorResult evaluate_vector_policy(const VectorPolicy& policy,
                                    const EvaluationContext& context,
                                    const VectorMaps& maps);

// Three decimal places, e.g. "0.967".
std::string format_similarity(double similarity);

}  // namespace warden
