#include "ScrollbackBuffer.hpp"
#include "TestHeaders.hpp"

using namespace pmx;

TEST_CASE("Scrollback keeps output in order", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(64);
  REQUIRE(buffer.empty());
  buffer.append("hello ");
  buffer.append("");
  buffer.append("world");
  REQUIRE(buffer.contents() == "hello world");
  REQUIRE(buffer.size() == 11);

  buffer.clear();
  REQUIRE(buffer.empty());
  REQUIRE(buffer.contents().empty());
}

TEST_CASE("Scrollback drops the oldest chunks first", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(10);
  buffer.append("aaaa");
  buffer.append("bbbb");
  buffer.append("cccc");
  REQUIRE(buffer.contents() == "bbbbcccc");
  REQUIRE(buffer.size() <= buffer.getMaxBytes());
}

TEST_CASE("An oversized chunk keeps only its tail", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(4);
  buffer.append("xy");
  buffer.append("0123456789");
  REQUIRE(buffer.contents() == "6789");
  REQUIRE(buffer.size() == 4);
}
