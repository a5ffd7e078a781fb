#include <gtest/gtest.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <sstream>
#include <iostream>

namespace plug_scan {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        old_cerr_ = std::cerr.rdbuf(err_.rdbuf());
    }
    void TearDown() override { std::cerr.rdbuf(old_cerr_); }
    std::stringstream err_;
    std::streambuf* old_cerr_ = nullptr;
};

TEST_F(PrivilegeTest, AvailabilityMatchesBuild) {
#ifdef PLUG_SCAN_HAVE_LIBCAP
    EXPECT_TRUE(is_privilege_available());
#else
    EXPECT_FALSE(is_privilege_available());
#endif
}

TEST_F(PrivilegeTest, LogCapabilitiesWritesContext) {
    log_capabilities("test context");
#ifdef PLUG_SCAN_HAVE_LIBCAP
    EXPECT_NE(err_.str().find("test context"), std::string::npos);
#else
    EXPECT_NE(err_.str().find("libcap not compiled in"), std::string::npos);
#endif
}

TEST_F(PrivilegeTest, DropCapabilitiesSucceedsUnprivileged) {
    // clearing an already empty set is allowed for any process
    EXPECT_TRUE(drop_capabilities());
#ifdef PLUG_SCAN_HAVE_LIBCAP
    EXPECT_NE(err_.str().find("Capabilities after drop"), std::string::npos);
#endif
}

} // namespace plug_scan
