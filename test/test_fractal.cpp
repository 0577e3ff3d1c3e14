#include <doctest/doctest.h>

#include "fractal.hpp"

TEST_CASE("escape_time: origin never escapes") {
  const std::size_t limits[] = {1, 2, 10, 255, 1000, 10'000};
  for (std::size_t limit : limits) {
    CAPTURE(limit);
    CHECK_FALSE(escape_time(Complex(0.0, 0.0), limit).has_value());
    CHECK_FALSE(escape_time(Complex(0.0, 0.0), limit, REFERENCE_ESCAPE_NORM).has_value());
  }
}

TEST_CASE("escape_time: known escaping points") {
  CHECK(escape_time(Complex(1.0, 2.0), 100) == std::size_t{1});
  CHECK(escape_time(Complex(-0.4, 0.6), 1000) == std::size_t{26});
  CHECK(escape_time(Complex(-1.75, -0.02), 1000) == std::size_t{13});
  CHECK(escape_time(Complex(2.0, 2.0), 100) == std::size_t{1});
  CHECK(escape_time(Complex(0.5, 0.0), 100) == std::size_t{5});
}

TEST_CASE("escape_time: known bounded point") {
  CHECK_FALSE(escape_time(Complex(0.32, -0.04), 1000).has_value());
}

TEST_CASE("escape_time: larger escape norm takes longer to escape") {
  CHECK(escape_time(Complex(-0.4, 0.6), 1000, REFERENCE_ESCAPE_NORM) == std::size_t{27});
  CHECK(escape_time(Complex(2.0, 2.0), 100, REFERENCE_ESCAPE_NORM) == std::size_t{2});
  CHECK(escape_time(Complex(0.5, 0.0), 100, REFERENCE_ESCAPE_NORM) == std::size_t{6});
}

TEST_CASE("escape_time: count stays below the limit") {
  for (std::size_t limit = 1; limit <= 30; ++limit) {
    for (double re = -2.5; re <= 1.5; re += 0.25) {
      for (double im = -1.5; im <= 1.5; im += 0.25) {
        const EscapeResult r = escape_time(Complex(re, im), limit);
        if (r) CHECK(*r < limit);
      }
    }
  }
}

TEST_CASE("escape_time: a limit of one never reports an escape") {
  // z0 = 0 is the only value tested, and it is always inside the radius
  for (double re = -3.0; re <= 3.0; re += 0.5) {
    for (double im = -3.0; im <= 3.0; im += 0.5) {
      CHECK_FALSE(escape_time(Complex(re, im), 1).has_value());
      CHECK_FALSE(burning_ship(Complex(re, im), 1).has_value());
    }
  }
}

TEST_CASE("escape_time: zero limit never escapes") {
  CHECK_FALSE(escape_time(Complex(10.0, 10.0), 0).has_value());
}

TEST_CASE("burning_ship: origin never escapes") {
  CHECK_FALSE(burning_ship(Complex(0.0, 0.0), 1000).has_value());
}

TEST_CASE("burning_ship: escapes with the canonical radius") {
  CHECK(burning_ship(Complex(2.0, 2.0), 100) == std::size_t{1});
}

TEST_CASE("burning_ship: real part of z is folded from the imaginary part") {
  // With z folded onto (|Im z|, |Im z|) a real c keeps z = c forever.
  // The textbook (|Re z|, |Im z|) fold would escape at step 5.
  CHECK_FALSE(burning_ship(Complex(0.5, 0.0), 100).has_value());
  CHECK(escape_time(Complex(0.5, 0.0), 100) == std::size_t{5});
}

TEST_CASE("compute_escape: dispatches on the algorithm") {
  const Complex c(0.5, 0.0);
  CHECK(compute_escape(AlgorithmType::Classic, c, 100) == escape_time(c, 100));
  CHECK(compute_escape(AlgorithmType::BurningShip, c, 100) == burning_ship(c, 100));
  CHECK(compute_escape(AlgorithmType::Classic, c, 100, REFERENCE_ESCAPE_NORM)
        == std::size_t{6});
}

TEST_CASE("compute_escape: deterministic") {
  for (double re = -2.0; re <= 1.0; re += 0.1) {
    const Complex c(re, 0.3);
    CHECK(compute_escape(AlgorithmType::Classic, c, 500)
          == compute_escape(AlgorithmType::Classic, c, 500));
    CHECK(compute_escape(AlgorithmType::BurningShip, c, 500)
          == compute_escape(AlgorithmType::BurningShip, c, 500));
  }
}

TEST_CASE("parse_algorithm: names and fallback") {
  bool known = false;
  CHECK(parse_algorithm("escape_time", &known) == AlgorithmType::Classic);
  CHECK(known);
  CHECK(parse_algorithm("burning_ship", &known) == AlgorithmType::BurningShip);
  CHECK(known);
  CHECK(parse_algorithm("mandelbrot", &known) == AlgorithmType::Classic);
  CHECK(known);
  CHECK(parse_algorithm("julia", &known) == AlgorithmType::Classic);
  CHECK_FALSE(known);
  CHECK(parse_algorithm("") == AlgorithmType::Classic);

  CHECK(std::string(algorithm_name(AlgorithmType::BurningShip)) == "burning_ship");
  CHECK(parse_algorithm(algorithm_name(AlgorithmType::BurningShip))
        == AlgorithmType::BurningShip);
}
