#include <catch2/catch_all.hpp>
#include <sqvec/kernels/distance.hpp>

#include <random>
#include <vector>

using sqvec::kernels::l2_sq_f64;

TEST_CASE("l2_sq_f64 known values", "[kernels]") {
  const float a[3]{1, 2, 3};
  const float b[3]{1, 2, 3};
  REQUIRE(l2_sq_f64(a, b) == 0.0);

  const float c[2]{0, 0};
  const float d[2]{1, 1};
  REQUIRE(l2_sq_f64(c, d) == 2.0);

  const float e[3]{1, 2, 3};
  const float f[3]{4, 5, 6};
  REQUIRE(l2_sq_f64(e, f) == 27.0);

  const float g[1]{0};
  const float h[1]{4};
  REQUIRE(l2_sq_f64(g, h) == 16.0);

  const float i3[1]{3};
  const float i7[1]{7};
  REQUIRE(l2_sq_f64(i3, i7) == 16.0);

  const float x[3]{1, 0, 0};
  const float y[3]{0, 1, 0};
  REQUIRE(l2_sq_f64(x, y) == 2.0);

  REQUIRE(l2_sq_f64({}, {}) == 0.0);
}

TEST_CASE("l2_sq_f64 unrolled path matches a naive loop", "[kernels]") {
  std::mt19937 rng(7);
  std::uniform_real_distribution<float> dist(-10.0f, 10.0f);
  for (std::size_t n : {1u, 3u, 4u, 5u, 17u, 384u, 1001u}) {
    std::vector<float> a(n), b(n);
    for (auto& x : a) x = dist(rng);
    for (auto& x : b) x = dist(rng);
    double naive = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
      naive += diff * diff;
    }
    REQUIRE(l2_sq_f64(a, b) == Catch::Approx(naive).epsilon(1e-12));
    REQUIRE(l2_sq_f64(a, b) == l2_sq_f64(b, a));
  }
}
