#include "cronwork/scheduler/cron.hpp"

#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace cronwork;
using cronwork::test::utc;

class CronTest : public ::testing::Test {
protected:
  static auto next(std::string_view expr, TimePoint after) -> TimePoint {
    auto cron = CronExpr::parse(expr);
    EXPECT_TRUE(cron.has_value()) << CronExpr::explain(expr);
    return cron ? cron->next_after(after) : TimePoint::max();
  }
};

TEST_F(CronTest, ParseEveryMinute) {
  auto result = CronExpr::parse("* * * * *");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value().raw(), "* * * * *");
}

TEST_F(CronTest, ParseAliases) {
  for (const char* alias : {"@yearly", "@annually", "@monthly", "@weekly",
                            "@daily", "@midnight", "@hourly"}) {
    auto result = CronExpr::parse(alias);
    ASSERT_TRUE(result.has_value()) << alias;
    EXPECT_EQ(result->raw(), alias);
  }
}

TEST_F(CronTest, AliasesExpandToCanonicalFields) {
  auto from = utc(2024, 5, 15, 10, 30);
  EXPECT_EQ(next("@hourly", from), next("0 * * * *", from));
  EXPECT_EQ(next("@daily", from), next("0 0 * * *", from));
  EXPECT_EQ(next("@weekly", from), next("0 0 * * 0", from));
  EXPECT_EQ(next("@monthly", from), next("0 0 1 * *", from));
  EXPECT_EQ(next("@yearly", from), utc(2025, 1, 1));
}

TEST_F(CronTest, FirstOfMonthFromMidFebruary) {
  EXPECT_EQ(next("0 0 1 * *", utc(2024, 2, 15)), utc(2024, 3, 1));
}

TEST_F(CronTest, LastDayOfMonthLeapYear) {
  EXPECT_EQ(next("0 0 L * *", utc(2024, 2, 1)), utc(2024, 2, 29));
}

TEST_F(CronTest, LastDayOfMonthNonLeapYear) {
  EXPECT_EQ(next("0 0 L * *", utc(2023, 2, 1)), utc(2023, 2, 28));
}

TEST_F(CronTest, LastDayCombinedWithList) {
  // 15th and the last day of each month
  auto after = utc(2024, 4, 16);
  EXPECT_EQ(next("0 12 15,L * *", after), utc(2024, 4, 30, 12));
}

TEST_F(CronTest, NextIsStrictlyAfterReference) {
  auto exact = utc(2024, 3, 10, 8, 0);
  EXPECT_EQ(next("0 8 * * *", exact), utc(2024, 3, 11, 8, 0));
  EXPECT_EQ(next("* * * * *", exact), utc(2024, 3, 10, 8, 1));
}

TEST_F(CronTest, SecondsAreTruncated) {
  auto from = utc(2024, 3, 10, 8, 0) + std::chrono::seconds(59);
  EXPECT_EQ(next("* * * * *", from), utc(2024, 3, 10, 8, 1));
}

TEST_F(CronTest, StepsAndRanges) {
  auto from = utc(2024, 1, 1, 9, 7);
  EXPECT_EQ(next("*/15 * * * *", from), utc(2024, 1, 1, 9, 15));
  EXPECT_EQ(next("0 9-17/4 * * *", from), utc(2024, 1, 1, 13, 0));
  EXPECT_EQ(next("5,10 * * * *", from), utc(2024, 1, 1, 9, 10));
}

TEST_F(CronTest, WeekdaySevenIsSunday) {
  // 2024-01-01 is a Monday
  auto from = utc(2024, 1, 1);
  EXPECT_EQ(next("0 0 * * 7", from), utc(2024, 1, 7));
  EXPECT_EQ(next("0 0 * * 0", from), utc(2024, 1, 7));
}

TEST_F(CronTest, NamedWeekdayRangeWraps) {
  // fri-mon from a Tuesday
  auto from = utc(2024, 1, 2);
  EXPECT_EQ(next("0 0 * * fri-mon", from), utc(2024, 1, 5));

  auto cron = CronExpr::parse("0 0 * * fri-mon");
  ASSERT_TRUE(cron.has_value());
  EXPECT_TRUE(cron->matches(utc(2024, 1, 6)));   // Saturday
  EXPECT_TRUE(cron->matches(utc(2024, 1, 8)));   // Monday
  EXPECT_FALSE(cron->matches(utc(2024, 1, 9)));  // Tuesday
}

TEST_F(CronTest, NamedMonths) {
  EXPECT_EQ(next("0 0 1 jun *", utc(2024, 1, 1)), utc(2024, 6, 1));
  EXPECT_EQ(next("0 0 1 NOV-FEB *", utc(2024, 3, 1)), utc(2024, 11, 1));
}

TEST_F(CronTest, DayOfMonthOrWeekdayWhenBothRestricted) {
  // 13th of the month or any Friday
  auto cron = CronExpr::parse("0 0 13 * 5");
  ASSERT_TRUE(cron.has_value());
  EXPECT_TRUE(cron->matches(utc(2024, 1, 5)));    // Friday the 5th
  EXPECT_TRUE(cron->matches(utc(2024, 1, 13)));   // Saturday the 13th
  EXPECT_FALSE(cron->matches(utc(2024, 1, 14)));  // Sunday the 14th
  EXPECT_EQ(cron->next_after(utc(2024, 1, 6)), utc(2024, 1, 12));
}

TEST_F(CronTest, OnlyRestrictedDayFieldConstrains) {
  auto weekday_only = CronExpr::parse("0 0 * * 1");
  ASSERT_TRUE(weekday_only.has_value());
  EXPECT_FALSE(weekday_only->matches(utc(2024, 1, 13)));
  EXPECT_TRUE(weekday_only->matches(utc(2024, 1, 15)));
}

TEST_F(CronTest, LeapDayJumpsAcrossYears) {
  EXPECT_EQ(next("0 0 29 2 *", utc(2024, 3, 1)), utc(2028, 2, 29));
}

TEST_F(CronTest, Monotonic) {
  const char* exprs[] = {"* * * * *",    "*/7 3-5 * * *", "0 0 L * *",
                         "15 10 * * 1-5", "0 0 29 2 *",    "0 0 13 * 5",
                         "30 2 1,15 jan,jul *"};
  for (const char* expr : exprs) {
    auto cron = CronExpr::parse(expr);
    ASSERT_TRUE(cron.has_value()) << expr;
    auto t = utc(2023, 12, 30, 23, 58);
    for (int i = 0; i < 20; ++i) {
      auto n = cron->next_after(t);
      ASSERT_GT(n, t) << expr;
      EXPECT_TRUE(cron->matches(n)) << expr << " at " << format_time(n);
      t = n;
    }
  }
}

TEST_F(CronTest, AllBetweenRespectsLimitAndEnd) {
  auto cron = CronExpr::parse("0 * * * *");
  ASSERT_TRUE(cron.has_value());

  auto hours = cron->all_between(utc(2024, 1, 1), utc(2024, 1, 1, 5), 100);
  ASSERT_EQ(hours.size(), 5u);
  EXPECT_EQ(hours.front(), utc(2024, 1, 1, 0));
  EXPECT_EQ(hours.back(), utc(2024, 1, 1, 4));

  auto limited = cron->all_between(utc(2024, 1, 1), utc(2025, 1, 1), 3);
  EXPECT_EQ(limited.size(), 3u);
}

TEST_F(CronTest, RejectsWrongFieldCount) {
  EXPECT_FALSE(CronExpr::parse("* * * *").has_value());
  EXPECT_FALSE(CronExpr::parse("* * * * * *").has_value());
  EXPECT_FALSE(CronExpr::parse("").has_value());
}

TEST_F(CronTest, RejectsMalformedFields) {
  for (const char* expr :
       {"1- * * * *", "-5 * * * *", "60 * * * *", "* 24 * * *", "* * 0 * *",
        "* * * 13 *", "* * * * 8", "*/0 * * * *", "5-1 * * * *",
        "1,,2 * * * *", "* * * * L", "* * L/2 * *", "@every_minute",
        "abc * * * *"}) {
    EXPECT_FALSE(CronExpr::parse(expr).has_value()) << expr;
    EXPECT_FALSE(CronExpr::explain(expr).empty()) << expr;
  }
}

TEST_F(CronTest, RejectsImpossibleDayOfMonth) {
  EXPECT_FALSE(CronExpr::parse("0 0 31 2 *").has_value());
  EXPECT_FALSE(CronExpr::parse("0 0 30,31 feb *").has_value());
  EXPECT_FALSE(CronExpr::parse("0 0 31 4,6,9,11 *").has_value());
  EXPECT_TRUE(CronExpr::parse("0 0 31 1,2 *").has_value());
  EXPECT_TRUE(CronExpr::parse("0 0 29 2 *").has_value());
}

TEST_F(CronTest, ExplainIsEmptyForValidExpression) {
  EXPECT_TRUE(CronExpr::explain("0 9 * * mon-fri").empty());
  EXPECT_NE(CronExpr::explain("0 0 31 2 *").find("never occurs"),
            std::string::npos);
}
