// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

#include <fmt/format.h>

#include "utils/Enum.hh"

enum class ReceiptKind
{
  Unknown,
  Sandbox,
  Production,
  Xcode
};

template<>
struct storekit::utils::enum_traits<ReceiptKind>
{
  static constexpr auto invalid = ReceiptKind::Unknown;

  static constexpr std::array<std::pair<std::string_view, ReceiptKind>, 3> names{
    {{"Sandbox", ReceiptKind::Sandbox}, {"Production", ReceiptKind::Production}, {"Xcode", ReceiptKind::Xcode}}};
};

enum class Plain
{
  A,
  B
};

template<>
struct storekit::utils::enum_traits<Plain>
{
  static constexpr std::array<std::pair<std::string_view, Plain>, 2> names{{{"a", Plain::A}, {"b", Plain::B}}};
};

TEST(EnumTests, test_enum_traits_detection)
{
  EXPECT_TRUE(storekit::utils::enum_has_names_v<ReceiptKind>);
  EXPECT_TRUE(storekit::utils::enum_has_invalid_v<ReceiptKind>);
  EXPECT_TRUE(storekit::utils::enum_has_names_v<Plain>);
  EXPECT_FALSE(storekit::utils::enum_has_invalid_v<Plain>);
}

TEST(EnumTests, test_enum_from_string)
{
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>("Sandbox"), ReceiptKind::Sandbox);
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>("Production"), ReceiptKind::Production);
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>("Xcode"), ReceiptKind::Xcode);
}

TEST(EnumTests, test_enum_from_string_unknown_value)
{
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>("LocalTesting"), ReceiptKind::Unknown);
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>("sandbox"), ReceiptKind::Unknown);
  EXPECT_EQ(storekit::utils::enum_from_string<ReceiptKind>(""), ReceiptKind::Unknown);
}

TEST(EnumTests, test_enum_parse)
{
  EXPECT_EQ(storekit::utils::enum_parse<Plain>("a"), Plain::A);
  EXPECT_EQ(storekit::utils::enum_parse<Plain>("b"), Plain::B);
  EXPECT_FALSE(storekit::utils::enum_parse<Plain>("c").has_value());
}

TEST(EnumTests, test_enum_to_string)
{
  EXPECT_EQ(storekit::utils::enum_to_string(ReceiptKind::Sandbox), "Sandbox");
  EXPECT_EQ(storekit::utils::enum_to_string(ReceiptKind::Production), "Production");
  EXPECT_EQ(storekit::utils::enum_to_string(ReceiptKind::Unknown), "");
  EXPECT_EQ(storekit::utils::enum_to_string(Plain::B), "b");
}

TEST(EnumTests, test_enum_stream)
{
  std::stringstream ss;
  ss << ReceiptKind::Xcode << "," << Plain::A;
  EXPECT_EQ(ss.str(), "Xcode,a");
}

TEST(EnumTests, test_enum_fmt)
{
  EXPECT_EQ(fmt::format("{}", ReceiptKind::Production), "Production");
  EXPECT_EQ(fmt::format("[{:>8}]", Plain::B), "[       b]");
}
