#include <gtest/gtest.h>
#include "../../src/compare/nondeterminism_locator.h"

using namespace TraceDiff;

class NondeterminismLocatorTest : public ::testing::Test {
protected:
    NondeterminismLocator locator_;
};

TEST_F(NondeterminismLocatorTest, JobAnnotation) {
    auto masked = locator_.Locate("[1] (26263) ./myspin 2 &");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->shape, LineShape::kJobAnnotation);
    EXPECT_EQ(masked->prefix, "[1]");
    EXPECT_EQ(masked->field, "26263");
    EXPECT_EQ(masked->suffix, " ./myspin 2 &");
}

TEST_F(NondeterminismLocatorTest, JobAnnotationWithJobPrefix) {
    auto masked = locator_.Locate("Job [2] (26265) stopped by signal 20");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->shape, LineShape::kJobAnnotation);
    EXPECT_EQ(masked->prefix, "Job [2]");
    EXPECT_EQ(masked->suffix, " stopped by signal 20");
}

TEST_F(NondeterminismLocatorTest, ProcessListingStripsProgramName) {
    auto masked = locator_.Locate("  26263 pts/0    S      0:00 ./tsh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->shape, LineShape::kProcessListing);
    EXPECT_EQ(masked->field, "26263");
    EXPECT_EQ(masked->prefix, " pts/0    S      0:00 ./");
    EXPECT_EQ(masked->suffix, " -p");
}

TEST_F(NondeterminismLocatorTest, ProcessListingPrefersLongerToken) {
    auto masked = locator_.Locate(" 1234 pts/3    S+     0:00 ./tshref -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/3    S+     0:00 ./");
    EXPECT_EQ(masked->suffix, " -p");
}

TEST_F(NondeterminismLocatorTest, ProcessListingOfDriver) {
    auto masked = locator_.Locate(
        " 5120 pts/0    S+     0:00 /usr/bin/perl ./sdriver.pl -t trace11.txt -s ./tsh -a -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S+     0:00 /usr/bin/perl ./sdriver.pl -t trace11.txt -s ./");
    EXPECT_EQ(masked->suffix, " -a -p");
}

TEST_F(NondeterminismLocatorTest, ProcessListingWithoutProgramToken) {
    auto masked = locator_.Locate("  42 pts/1    R      0:01 ./mysplit 4");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->shape, LineShape::kProcessListing);
    EXPECT_EQ(masked->field, "42");
    EXPECT_EQ(masked->prefix, " pts/1    R      0:01 ./mysplit 4");
    EXPECT_EQ(masked->suffix, "");
}

TEST_F(NondeterminismLocatorTest, FragmentsNeverContainThePid) {
    auto masked = locator_.Locate(" 987654 pts/2    T      0:00 ./tsh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix.find("987654"), std::string::npos);
    EXPECT_EQ(masked->suffix.find("987654"), std::string::npos);

    masked = locator_.Locate("[3] (987654) ./myint 5");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix.find("987654"), std::string::npos);
    EXPECT_EQ(masked->suffix.find("987654"), std::string::npos);
}

TEST_F(NondeterminismLocatorTest, ClassificationSurvivesPidSubstitution) {
    const std::string line = " 31337 pts/0    S      0:00 ./tsh -p";
    auto original = locator_.Locate(line);
    ASSERT_TRUE(original.has_value());

    for (const std::string pid : {"1", "42", "99999", "1234567890"}) {
        const std::string rebuilt = " " + pid + original->prefix + "tsh" + original->suffix;
        auto masked = locator_.Locate(rebuilt);
        ASSERT_TRUE(masked.has_value()) << rebuilt;
        EXPECT_EQ(masked->shape, LineShape::kProcessListing);
        EXPECT_EQ(masked->prefix, original->prefix);
        EXPECT_EQ(masked->suffix, original->suffix);
        EXPECT_EQ(masked->field, pid);
    }

    auto job = locator_.Locate("[1] (26263) ./myspin 2 &");
    ASSERT_TRUE(job.has_value());
    for (const std::string pid : {"7", "4194304"}) {
        auto masked = locator_.Locate(job->prefix + " (" + pid + ")" + job->suffix);
        ASSERT_TRUE(masked.has_value());
        EXPECT_EQ(masked->shape, LineShape::kJobAnnotation);
        EXPECT_EQ(masked->prefix, job->prefix);
        EXPECT_EQ(masked->suffix, job->suffix);
    }
}

TEST_F(NondeterminismLocatorTest, MalformedLinesArePlain) {
    EXPECT_FALSE(locator_.Locate("[1 (23) ./myspin").has_value());
    EXPECT_FALSE(locator_.Locate("[1] (abc) ./myspin").has_value());
    EXPECT_FALSE(locator_.Locate("[1] (23 ./myspin").has_value());
    EXPECT_FALSE(locator_.Locate("[1] 23 ./myspin").has_value());
    EXPECT_FALSE(locator_.Locate("[] (23) ./myspin").has_value());
    EXPECT_FALSE(locator_.Locate("Added job [1] 123 ./myspin").has_value());
    // pid longer than 10 digits
    EXPECT_FALSE(locator_.Locate(" 12345678901 pts/0 S 0:00 ./tsh").has_value());
    EXPECT_FALSE(locator_.Locate("[1] (12345678901) ./myspin").has_value());
}

TEST_F(NondeterminismLocatorTest, OrdinaryOutputIsPlain) {
    EXPECT_EQ(locator_.Classify("tsh> jobs"), LineShape::kPlain);
    EXPECT_EQ(locator_.Classify(""), LineShape::kPlain);
    EXPECT_EQ(locator_.Classify("  PID TTY      STAT   TIME COMMAND"), LineShape::kPlain);
    EXPECT_EQ(locator_.Classify("  123 ?        Ss     0:00 /sbin/init"), LineShape::kPlain);
    // Needs leading whitespace before the pid
    EXPECT_EQ(locator_.Classify("123 pts/0 S 0:00 ./tsh"), LineShape::kPlain);
}

TEST(NondeterminismLocatorTokenTest, CustomProgramTokens) {
    NondeterminismLocator locator({"mysh"});
    auto masked = locator.Locate(" 77 pts/0    S      0:00 ./mysh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S      0:00 ./");
    EXPECT_EQ(masked->suffix, " -p");
}

TEST(NondeterminismLocatorTokenTest, TokensAreMatchedLiterally) {
    NondeterminismLocator locator({"a.out"});
    auto masked = locator.Locate(" 77 pts/0    S      0:00 ./a.out -v");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->suffix, " -v");

    // '.' must not act as a wildcard
    masked = locator.Locate(" 77 pts/0    S      0:00 ./aXout -v");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S      0:00 ./aXout -v");
    EXPECT_EQ(masked->suffix, "");
}

TEST(NondeterminismLocatorTokenTest, NoTokensStillLocatesListings) {
    NondeterminismLocator locator(std::vector<std::string>{});
    auto masked = locator.Locate(" 77 pts/0    S      0:00 ./tsh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S      0:00 ./tsh -p");
    EXPECT_TRUE(locator.program_tokens().empty());
}

TEST_F(NondeterminismLocatorTest, VeryLongLinesAreLocated) {
    const std::string tail(100000, 'x');

    auto job = locator_.Locate("[1] (123) " + tail);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->shape, LineShape::kJobAnnotation);
    EXPECT_EQ(job->field, "123");
    EXPECT_EQ(job->suffix.size(), tail.size() + 1);

    auto listing = locator_.Locate(" 1 pts/0 " + tail);
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->shape, LineShape::kProcessListing);
    EXPECT_EQ(listing->field, "1");
    EXPECT_EQ(listing->prefix, " pts/0 " + tail);

    auto with_program = locator_.Locate(" 1 pts/0 " + tail + " ./tsh -p");
    ASSERT_TRUE(with_program.has_value());
    EXPECT_EQ(with_program->suffix, " -p");

    EXPECT_FALSE(locator_.Locate(tail).has_value());
    EXPECT_FALSE(locator_.Locate(std::string(100000, ' ')).has_value());
}

TEST_F(NondeterminismLocatorTest, TokenInsideDirectoryNameIsNotTheProgram) {
    auto masked = locator_.Locate("  501 pts/0    S+     0:00 /home/u/tsh-lab/tsh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S+     0:00 /home/u/tsh-lab/");
    EXPECT_EQ(masked->suffix, " -p");

    masked = locator_.Locate("  502 pts/0    S+     0:00 /tmp/tshtest/tsh -p");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S+     0:00 /tmp/tshtest/");
    EXPECT_EQ(masked->suffix, " -p");

    // Program name at the end of the line
    masked = locator_.Locate("  503 pts/0    S+     0:00 /opt/tshref");
    ASSERT_TRUE(masked.has_value());
    EXPECT_EQ(masked->prefix, " pts/0    S+     0:00 /opt/");
    EXPECT_EQ(masked->suffix, "");
}
