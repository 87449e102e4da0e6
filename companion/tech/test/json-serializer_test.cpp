#include "companion/json-serializer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace {

struct Announcement {
  std::string text;
  int64_t count;
  std::optional<std::string> note;
};

}  // namespace

template <>
struct glz::meta<Announcement> {
  using T = Announcement;
  static constexpr auto value = glz::object("text", &T::text, "count", &T::count, "note", &T::note);
};

namespace companion {

TEST(JsonSerializerTest, FieldsInDeclarationOrder) {
  EXPECT_EQ(SerializeToJson(Announcement{"hello", 3, "n"}), R"({"text":"hello","count":3,"note":"n"})");
}

TEST(JsonSerializerTest, AbsentOptionalIsSkipped) {
  EXPECT_EQ(SerializeToJson(Announcement{"hello", 3, std::nullopt}), R"({"text":"hello","count":3})");
}

TEST(JsonSerializerTest, EscapesStrings) {
  const std::string json = SerializeToJson(Announcement{"a\"b\\c\nd", 0, std::nullopt});
  EXPECT_EQ(json, R"({"text":"a\"b\\c\nd","count":0})");
}

TEST(JsonSerializerTest, MapKeysInOrder) {
  const std::map<std::string, std::string> map{{"b", "2"}, {"a", "1"}};
  EXPECT_EQ(SerializeToJson(map), R"({"a":"1","b":"2"})");
}

}  // namespace companion
