#include "engine/decision/sensitivity.hpp"

#include "engine/core/logging.hpp"

#include <sstream>
#include <utility>

namespace ktda {

SensitivityReport analyze_weight_sensitivity(const DecisionTable& table, const SensitivitySettings& settings) {
  settings.validate_or_throw();

  SensitivityReport out;
  out.baseline_best = table.best_alternative();
  out.records.reserve(table.criterion_count() * settings.factors.size());

  for (std::size_t c = 0; c < table.criterion_count(); ++c) {
    for (double f : settings.factors) {
      std::vector<double> w = table.weights();
      w[c] *= f;

      SensitivityRecord rec;
      rec.criterion = table.criteria()[c];
      rec.criterion_index = c;
      rec.factor = f;
      rec.weight = w[c];

      const DecisionTable perturbed = table.with_weights(std::move(w));
      rec.best_index = perturbed.best_alternative();
      rec.changed = (rec.best_index != out.baseline_best);

      std::ostringstream oss;
      oss << "sensitivity " << rec.criterion << " x" << f << " weight=" << rec.weight
          << " best=" << rec.best_display() << (rec.changed ? " (changed)" : "");
      log(LogLevel::DEBUG, oss.str());

      out.records.push_back(std::move(rec));
    }
  }

  if (!out.stable()) {
    std::ostringstream oss;
    oss << out.changed_count() << " of " << out.records.size()
        << " weight perturbations change the best alternative";
    log(LogLevel::INFO, oss.str());
  }
  return out;
}

}  // namespace ktda
