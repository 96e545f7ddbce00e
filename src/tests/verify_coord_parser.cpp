#include "../coord_parser.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace dashgpx;

namespace {
bool near(double a, double b) { return std::abs(a - b) < 1e-9; }
}

void test_empty_and_garbage()
{
  std::cout << "Testing no-match input..." << std::endl;
  assert(!CoordinateParser::parse("").has_value());
  assert(!CoordinateParser::parse("   \n").has_value());
  assert(!CoordinateParser::parse("NSEW ,,, --").has_value());
  // A single number is not a pair
  assert(!CoordinateParser::parse("43.5N").has_value());
  // Integers without a fractional part don't match the numeric shape
  assert(!CoordinateParser::parse("43 79").has_value());
}

void test_underflowing_fraction()
{
  std::cout << "Testing fraction that underflows a double..." << std::endl;
  const std::string tiny = "0." + std::string(400, '0') + "1 79.2W";
  auto result = CoordinateParser::parse(tiny);
  assert(result.has_value());
  assert(std::abs(result->latitude) < 1e-300);
  assert(near(result->longitude, -79.2));
}

void test_oversized_text()
{
  std::cout << "Testing very long OCR text..." << std::endl;
  // Long run of non-digits after a number: must be a plain no-reading, not a crash
  assert(!CoordinateParser::parse("43.5" + std::string(100000, 'N')).has_value());
  assert(!CoordinateParser::parse(std::string(1000000, ',')).has_value());

  // A pair inside the searched window is still found
  auto early = CoordinateParser::parse("43.5N 79.2W" + std::string(100000, ' '));
  assert(early.has_value());
  assert(near(early->latitude, 43.5));
  assert(near(early->longitude, -79.2));

  // A pair past the window is ignored
  assert(!CoordinateParser::parse(std::string(kMaxOcrTextLength, ' ') + "43.5N 79.2W").has_value());
}

void test_hemisphere_letters()
{
  std::cout << "Testing hemisphere override..." << std::endl;
  auto sw = CoordinateParser::parse("43.5S 79.2E");
  assert(sw.has_value());
  assert(near(sw->latitude, -43.5));
  assert(near(sw->longitude, 79.2));

  auto nw = CoordinateParser::parse("43.5N 79.2W");
  assert(nw.has_value());
  assert(near(nw->latitude, 43.5));
  assert(near(nw->longitude, -79.2));

  // Letters beat the OCR'd minus sign
  auto forced = CoordinateParser::parse("-43.5N -79.2E");
  assert(forced.has_value());
  assert(near(forced->latitude, 43.5));
  assert(near(forced->longitude, 79.2));

  // Lower case letters count too
  auto lower = CoordinateParser::parse("12.25s, 130.75w");
  assert(lower.has_value());
  assert(near(lower->latitude, -12.25));
  assert(near(lower->longitude, -130.75));
}

void test_raw_signs_kept()
{
  std::cout << "Testing unlettered values..." << std::endl;
  auto plain = CoordinateParser::parse("43.5 79.2");
  assert(plain.has_value());
  assert(near(plain->latitude, 43.5));
  assert(near(plain->longitude, 79.2));

  auto signed_pair = CoordinateParser::parse("-43.123, 79.123");
  assert(signed_pair.has_value());
  assert(near(signed_pair->latitude, -43.123));
  assert(near(signed_pair->longitude, 79.123));

  // Only one axis lettered: the other keeps its raw sign
  auto half = CoordinateParser::parse("43.5S -79.2");
  assert(half.has_value());
  assert(near(half->latitude, -43.5));
  assert(near(half->longitude, -79.2));
}

void test_noisy_overlay_text()
{
  std::cout << "Testing noisy overlay text..." << std::endl;
  // Degree signs and junk around the numbers, as tesseract returns them
  auto deg = CoordinateParser::parse("0,, 43.65321\xC2\xB0N  79.38312\xC2\xB0W\n");
  assert(deg.has_value());
  assert(near(deg->latitude, 43.65321));
  assert(near(deg->longitude, -79.38312));

  // First matching pair wins
  auto first = CoordinateParser::parse("1.5 2.5 / 3.5 4.5");
  assert(first.has_value());
  assert(near(first->latitude, 1.5));
  assert(near(first->longitude, 2.5));
}

void test_determinism()
{
  std::cout << "Testing determinism..." << std::endl;
  const std::string text = "43.5S 79.2E";
  auto a = CoordinateParser::parse(text);
  auto b = CoordinateParser::parse(text);
  assert(a.has_value() && b.has_value());
  assert(a->latitude == b->latitude);
  assert(a->longitude == b->longitude);
}

int main()
{
  test_empty_and_garbage();
  test_underflowing_fraction();
  test_oversized_text();
  test_hemisphere_letters();
  test_raw_signs_kept();
  test_noisy_overlay_text();
  test_determinism();
  std::cout << "All coordinate parser tests passed." << std::endl;
  return 0;
}
