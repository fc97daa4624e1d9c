// ==============================================================================
// test_case_manager_gtest.cpp - Тесты управления делами (GoogleTest)
// ==============================================================================

#include "evidex/case_manager.hpp"
#include "evidex/errors.hpp"
#include "evidex/platform.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <string>

namespace evidex::cases::test {

class CaseManagerTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_cases_test_"; }

    void SetUp() override {
        TempDirTest::SetUp();
        store::DatabaseOptions opts;
        opts.path = test_dir_ / "cases.db";
        db_ = std::make_unique<store::Database>(opts);
        manager_ = std::make_unique<CaseManager>(*db_, "Det. Rivera");
    }

    void TearDown() override {
        manager_.reset();
        db_.reset();
        TempDirTest::TearDown();
    }

    std::unique_ptr<store::Database> db_;
    std::unique_ptr<CaseManager> manager_;
};

// ==============================================================================
// TST-CASEMGR-001: создание и открытие
// ==============================================================================

TEST_F(CaseManagerTest, CreateCase_GeneratesNumberAndAudits) {
    // Arrange
    store::NewCase data;
    data.case_name = "Warehouse fire";
    const std::string expected = "CASE-" + std::to_string(platform::current_year()) + "-0001";

    // Act
    std::int64_t id = manager_->create_case(data);

    // Assert
    auto c = store::CaseRepository(*db_).get_case(id);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->case_number, expected);

    auto logs = store::AuditRepository(*db_).case_logs(id);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].action, "create_case");
    EXPECT_EQ(logs[0].user_name, "Det. Rivera");
    EXPECT_EQ(logs[0].details.value_or(""), "{\"case_number\":\"" + expected + "\"}");
}

TEST_F(CaseManagerTest, CreateCase_SequentialNumbers) {
    store::NewCase data;
    data.case_name = "one";
    std::int64_t a = manager_->create_case(data);
    data.case_name = "two";
    std::int64_t b = manager_->create_case(data);

    store::CaseRepository cases(*db_);
    EXPECT_EQ(cases.get_case(a)->case_number.substr(10), "0001");
    EXPECT_EQ(cases.get_case(b)->case_number.substr(10), "0002");
}

TEST_F(CaseManagerTest, CreateCase_ExplicitDuplicateRejected) {
    store::NewCase data;
    data.case_number = "LAB-77";
    data.case_name = "first";
    manager_->create_case(data);

    try {
        manager_->create_case(data);
        FAIL() << "expected DuplicateCaseNumber";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateCaseNumber);
    }
    // Неудачное создание не попадает в журнал
    EXPECT_EQ(store::AuditRepository(*db_).logs_by_action("create_case").size(), 1u);
}

TEST_F(CaseManagerTest, OpenCase_AuditsOnlyExisting) {
    store::NewCase data;
    data.case_name = "open me";
    std::int64_t id = manager_->create_case(data);

    EXPECT_TRUE(manager_->open_case(id).has_value());
    EXPECT_FALSE(manager_->open_case(id + 50).has_value());

    EXPECT_EQ(store::AuditRepository(*db_).logs_by_action("open_case").size(), 1u);
}

// ==============================================================================
// TST-CASEMGR-002: закрытие и сводка
// ==============================================================================

TEST_F(CaseManagerTest, CloseCase) {
    store::NewCase data;
    data.case_name = "close me";
    std::int64_t id = manager_->create_case(data);

    manager_->close_case(id);

    EXPECT_EQ(store::CaseRepository(*db_).get_case(id)->status, store::CaseStatus::Closed);
    EXPECT_EQ(store::AuditRepository(*db_).case_logs(id)[0].action, "close_case");
}

TEST_F(CaseManagerTest, CloseCase_Missing_IsNotFound) {
    try {
        manager_->close_case(404);
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(CaseManagerTest, Summary_RecentAndFlagged) {
    // Arrange
    store::NewCase data;
    data.case_name = "summary";
    std::int64_t id = manager_->create_case(data);
    store::FileRepository files(*db_);
    std::int64_t flagged_id = 0;
    for (int i = 0; i < 12; ++i) {
        store::EvidenceFile f;
        f.case_id = id;
        f.file_name = "IMG_" + std::to_string(i) + ".jpg";
        f.file_path = "/evidence/" + f.file_name;
        f.file_type = taxonomy::Category::Image;
        char date[32];
        std::snprintf(date, sizeof(date), "2024-01-%02d 08:00:00", i + 1);
        f.date_taken = date;
        std::int64_t fid = files.add_file(f);
        if (i == 3) {
            flagged_id = fid;
        }
    }
    files.flag(flagged_id, "match");

    // Act
    auto s = manager_->summary(id);

    // Assert
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->info.case_name, "summary");
    EXPECT_EQ(s->statistics.total_files, 12);
    EXPECT_EQ(s->statistics.flagged_files, 1);
    ASSERT_EQ(s->recent_files.size(), SUMMARY_RECENT_FILES);
    EXPECT_EQ(s->recent_files[0].file_name, "IMG_11.jpg");
    ASSERT_EQ(s->flagged_files.size(), 1u);
    EXPECT_EQ(s->flagged_files[0].file_id, flagged_id);

    EXPECT_FALSE(manager_->summary(id + 1).has_value());
}

}  // namespace evidex::cases::test
