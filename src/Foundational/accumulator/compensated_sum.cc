#include "Foundational/accumulator/compensated_sum.h"

namespace accumulator {

CompensatedSum::CompensatedSum() {
  reset();
}

void
CompensatedSum::reset() {
  _sum = 0.0;
  _c = 0.0;
  _n = 0;
}

CompensatedSum&
CompensatedSum::operator+=(double d) {
  const double y = d - _c;
  const double t = _sum + y;
  _c = (t - _sum) - y;
  _sum = t;
  ++_n;

  return *this;
}

CompensatedSum&
CompensatedSum::operator+=(const CompensatedSum& rhs) {
  _c += rhs._c;
  const uint64_t n = _n + rhs._n;
  operator+=(rhs._sum);
  _n = n;

  return *this;
}

void
CompensatedSum::Add(double value, uint64_t n) {
  if (n == 0) {
    return;
  }

  operator+=(value * static_cast<double>(n));
  _n += n - 1;
}

}  // namespace accumulator
