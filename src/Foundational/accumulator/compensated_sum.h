#ifndef FOUNDATIONAL_ACCUMULATOR_COMPENSATED_SUM_H_
#define FOUNDATIONAL_ACCUMULATOR_COMPENSATED_SUM_H_

#include <cstdint>

namespace accumulator {

// Kahan compensated summation. Used wherever many small terms of
// similar magnitude are added, log probabilities in particular.
class CompensatedSum {
  private:
    double _sum;
    // Running compensation for the low order bits lost in _sum.
    double _c;
    // Number of terms added.
    uint64_t _n;

  public:
    CompensatedSum();

    void reset();

    CompensatedSum& operator+=(double d);
    CompensatedSum& operator+=(const CompensatedSum& rhs);

    // Add `value` `n` times. Added as a single term `value * n`.
    void Add(double value, uint64_t n);

    double sum() const {
      return _sum;
    }

    // The number of terms, with `Add(value, n)` counting as `n` terms.
    uint64_t n() const {
      return _n;
    }

    bool empty() const {
      return _n == 0;
    }
};

}  // namespace accumulator

#endif  // FOUNDATIONAL_ACCUMULATOR_COMPENSATED_SUM_H_
