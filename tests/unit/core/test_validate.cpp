#include <gtest/gtest.h>
#include <HypDisk/Core/Validate.h>
#include <HypDisk/Core/Exception.h>

#include <limits>
#include <string>

using namespace Hyp::Disk;

namespace {

void TakesPositive(double radius) {
    HYPDISK_REQUIRE_POSITIVE(radius);
}

void TakesCount(int count) {
    HYPDISK_REQUIRE_RANGE(count, 1, 10);
}

} // namespace

TEST(ValidateTest, FiniteAcceptsNumbers) {
    EXPECT_NO_THROW(Validate::RequireFinite(1.5, "x", "Test"));
    EXPECT_THROW(Validate::RequireFinite(std::numeric_limits<double>::infinity(), "x", "Test"),
                 InvalidArgumentException);
    EXPECT_THROW(Validate::RequireFinite(std::nan(""), "x", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, RangeInclusive) {
    EXPECT_NO_THROW(Validate::RequireRange(0.0, 0.0, 1.0, "r", "Test"));
    EXPECT_NO_THROW(Validate::RequireRange(1.0, 0.0, 1.0, "r", "Test"));
    EXPECT_THROW(Validate::RequireRange(1.01, 0.0, 1.0, "r", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, MinMax) {
    EXPECT_NO_THROW(Validate::RequireMin(3, 3, "n", "Test"));
    EXPECT_THROW(Validate::RequireMin(2, 3, "n", "Test"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireMax(360.0, 360.0, "a", "Test"));
    EXPECT_THROW(Validate::RequireMax(361.0, 360.0, "a", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, NonNegative) {
    EXPECT_NO_THROW(Validate::RequireNonNegative(0, "n", "Test"));
    EXPECT_THROW(Validate::RequireNonNegative(-1, "n", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, MacroNamesParameterAndFunction) {
    try {
        TakesPositive(-2.0);
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("TakesPositive"), std::string::npos);
        EXPECT_NE(msg.find("radius"), std::string::npos);
        EXPECT_NE(msg.find("-2"), std::string::npos);
    }
}

TEST(ValidateTest, RangeMacro) {
    EXPECT_NO_THROW(TakesCount(5));
    EXPECT_THROW(TakesCount(0), InvalidArgumentException);
}

TEST(ExceptionTest, HierarchyAndPrefixes) {
    InvalidSidesException sides("n < 3");
    EXPECT_NE(std::string(sides.what()).find("Invalid argument: sides: "), std::string::npos);

    const Exception& base = sides;
    EXPECT_NE(std::string(base.what()).find("n < 3"), std::string::npos);

    EXPECT_THROW(throw InvalidAnglesException("equal"), InvalidArgumentException);
    EXPECT_THROW(throw OutOfDomainException("r >= 1"), Exception);
    EXPECT_THROW(throw UninitializedSurfaceException("null"), std::runtime_error);
}
