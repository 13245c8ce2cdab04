#include "procex/result.hpp"

#include <gtest/gtest.h>

#include <cerrno>

namespace procex {

struct ArrowProbe {
  int value = 0;
  int get() const { return value; }
};

TEST(ResultTest, ErrorCategoryMessageNotEmpty) {
  auto code = make_error_code(errc::process_io);
  EXPECT_FALSE(code.message().empty());
  EXPECT_STREQ(code.category().name(), "procex");
}

TEST(ResultTest, ErrorCodeEquality) {
  std::error_code code = errc::incompatible_destination;
  EXPECT_EQ(code, make_error_code(errc::incompatible_destination));
  EXPECT_NE(code, make_error_code(errc::unsupported_redirection));
}

TEST(ResultTest, ExpectedValueAndError) {
  Result<int> ok(5);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok.value(), 5);

  Error err{make_error_code(errc::spawn_failed), "spawn"};
  Result<int> bad(err);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, err.code);
  EXPECT_EQ(bad.error().context, "spawn");
}

TEST(ResultTest, ExpectedOperatorArrowProvidesMemberAccess) {
  Result<ArrowProbe> ok(ArrowProbe{42});
  EXPECT_EQ(ok->value, 42);
  EXPECT_EQ(ok->get(), 42);

  const Result<ArrowProbe> const_ok(ArrowProbe{7});
  EXPECT_EQ(const_ok->get(), 7);
}

TEST(ResultTest, ToStringPrefixesContext) {
  Error with_context{make_error_code(errc::closed_stream), "monitored pipe"};
  EXPECT_EQ(to_string(with_context), "monitored pipe: closed stream");

  Error bare{make_error_code(errc::timeout), ""};
  EXPECT_EQ(to_string(bare), "timeout");
}

TEST(ResultTest, SystemErrorsKeepTheirCategory) {
  Error error{std::error_code(ENOENT, std::system_category()), "open out.txt"};
  EXPECT_EQ(error.code.category(), std::system_category());
  EXPECT_NE(to_string(error).find("open out.txt: "), std::string::npos);
}

}  // namespace procex
