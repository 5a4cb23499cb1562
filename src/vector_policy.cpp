#include "warden/vector_policy.hpp"
#include "warden/jsonlite.hpp"

#include <cmath>
#include <cstdio>

namespace warden {

std::string to_string(DimensionKind kind) {
  switch (kind) {
    case DimensionKind::numeric:     return "numeric";
    case DimensionKind::categorical: return "categorical";
  }
  return "numeric";
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size()) return 0.0;

  double dot = 0.0, mag_a = 0.0, mag_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot   += a[i] * b[i];
    mag_a += a[i] * a[i];
    mag_b += b[i] * b[i];
  }
  mag_a = std::sqrt(mag_a);
  mag_b = std::sqrt(mag_b);
  if (mag_a == 0.0 || mag_b == 0.0) return 0.0;
  return dot / (mag_a * mag_b);
}

std::string format_similarity(double similarity) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", similarity);
  return buf;
}

ProjectionResult project_context(const std::vector<VectorDimension>& dimensions,
                                 const std::map<std::string, AttributeValue>& attributes,
                                 const VectorMaps& maps) {
  ProjectionResult out;
  out.vector.reserve(dimensions.size());

  for (const auto& dim : dimensions) {
    const auto attr = attributes.find(dim.name);
    double coordinate = 0.0;

    if (dim.kind == DimensionKind::numeric) {
      if (attr != attributes.end()) {
        if (const auto* d = std::get_if<double>(&attr->second)) {
          coordinate = *d;
        } else if (const auto* b = std::get_if<bool>(&attr->second)) {
          coordinate = *b ? 1.0 : 0.0;
        }
      }
    } else {
      const auto table = maps.find(dim.map);
      if (table == maps.end()) {
        out.error = "Unknown value map '" + dim.map + "' for dimension '" + dim.name + "'";
        return out;
      }
      if (attr != attributes.end()) {
        if (const auto* s = std::get_if<std::string>(&attr->second)) {
          const auto hit = table->second.find(*s);
          if (hit != table->second.end()) coordinate = hit->second;
        }
      }
    }

    if (!std::isfinite(coordinate)) coordinate = 0.0;
    out.vector.push_back(coordinate);
  }

  out.ok = true;
  return out;
}

VectorResult evaluate_vector_policy(const VectorPolicy& policy,
                                    const EvaluationContext& context,
                                    const VectorMaps& maps) {
  VectorResult r;
  if (policy.position.empty() || policy.dimensions.empty() || !std::isfinite(policy.threshold)) {
    r.malformed = true;
    r.reason = "Resource is not defined correctly within the vector policy "
               "(missing position, threshold, or dimensions).";
    return r;
  }

  const auto projected = project_context(policy.dimensions, context.attributes, maps);
  if (!projected.ok) {
    r.malformed = true;
    r.reason    = projected.error;
    return r;
  }

  if (projected.vector.size() != policy.position.size()) {
    r.reason = "Vector dimension mismatch. Expected " + std::to_string(policy.position.size()) +
               ", got " + std::to_string(projected.vector.size()) + ".";
    return r;
  }

  r.similarity = cosine_similarity(policy.position, projected.vector);
  const std::string threshold = jsonlite::format_double(policy.threshold);
  if (r.similarity >= policy.threshold) {
    r.met    = true;
    r.reason = "Similarity " + format_similarity(r.similarity) + " meets threshold " + threshold;
  } else {
    r.reason = "Similarity " + format_similarity(r.similarity) + " is below threshold " + threshold;
  }
  return r;
}

}  // namespace warden
