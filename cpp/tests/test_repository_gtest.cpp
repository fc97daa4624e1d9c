// ==============================================================================
// test_repository_gtest.cpp - Тесты SQLite хранилища и репозиториев (GoogleTest)
// ==============================================================================

#include "evidex/database.hpp"
#include "evidex/errors.hpp"
#include "evidex/repository.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace evidex::store::test {

class RepositoryTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_repo_test_"; }

    void SetUp() override {
        TempDirTest::SetUp();
        DatabaseOptions opts;
        opts.path = test_dir_ / "cases.db";
        db_ = std::make_unique<Database>(opts);
    }

    void TearDown() override {
        db_.reset();
        TempDirTest::TearDown();
    }

    std::int64_t make_case(const std::string& number) {
        NewCase data;
        data.case_number = number;
        data.case_name = "Case " + number;
        return CaseRepository(*db_).create_case(data);
    }

    static EvidenceFile make_file(std::int64_t case_id, const std::string& name,
                                  taxonomy::Category type = taxonomy::Category::Image) {
        EvidenceFile f;
        f.case_id = case_id;
        f.file_name = name;
        f.file_path = "/evidence/" + name;
        f.file_relative_path = name;
        f.file_type = type;
        f.file_size = 1024;
        return f;
    }

    static const std::string& sample_hash() {
        static const std::string h(64, 'a');
        return h;
    }

    std::unique_ptr<Database> db_;
};

// ==============================================================================
// TST-DB-001: соединения, транзакции, настройки
// ==============================================================================

TEST_F(RepositoryTest, Database_CreatesFileAndSchema) {
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "cases.db"));

    std::int64_t tables = 0;
    db_->read([&](Connection& conn) {
        Statement st(conn,
                     "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN "
                     "('cases', 'evidence_files', 'audit_log', 'settings')");
        ASSERT_TRUE(st.step());
        tables = st.column_int64(0);
    });
    EXPECT_EQ(tables, 4);
}

TEST_F(RepositoryTest, Database_CreatesParentDirectory) {
    DatabaseOptions opts;
    opts.path = test_dir_ / "nested" / "dir" / "lab.db";

    Database db(opts);

    EXPECT_TRUE(std::filesystem::exists(opts.path));
}

TEST_F(RepositoryTest, Transaction_ExceptionRollsBack) {
    // Arrange
    CaseRepository cases(*db_);

    // Act
    EXPECT_THROW(db_->transaction([&](Connection& conn) {
        Statement st(conn, "INSERT INTO cases (case_number, case_name) VALUES ('R-1', 'r')");
        st.run();
        throw std::runtime_error("abort");
    }),
                 std::runtime_error);

    // Assert
    EXPECT_FALSE(cases.get_case_by_number("R-1").has_value());
    // Соединение вернулось в пул и пригодно для записи
    EXPECT_NO_THROW(make_case("R-2"));
}

TEST_F(RepositoryTest, Settings_UpsertAndRead) {
    EXPECT_FALSE(db_->get_setting("last_case").has_value());

    db_->set_setting("last_case", "1");
    db_->set_setting("last_case", "7");

    EXPECT_EQ(db_->get_setting("last_case").value_or(""), "7");
}

TEST_F(RepositoryTest, ConcurrentInserts_AllCommitted) {
    // Arrange
    std::int64_t case_id = make_case("CASE-2024-0001");
    constexpr int THREADS = 6;
    constexpr int PER_THREAD = 40;
    std::atomic<int> failures{0};

    // Act
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            FileRepository files(*db_);
            for (int i = 0; i < PER_THREAD; ++i) {
                try {
                    files.add_file(make_file(case_id, "t" + std::to_string(t) + "_" +
                                                          std::to_string(i) + ".jpg"));
                } catch (const Error&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    // Assert
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(FileRepository(*db_).get_files_by_case(case_id).size(),
              static_cast<std::size_t>(THREADS * PER_THREAD));
    EXPECT_LE(db_->connection_count(), static_cast<std::size_t>(THREADS + 1));
}

// ==============================================================================
// TST-CASE-001: дела
// ==============================================================================

TEST_F(RepositoryTest, CreateCase_RoundTrip) {
    // Arrange
    NewCase data;
    data.case_number = "CASE-2024-0001";
    data.case_name = "Harbor burglary";
    data.investigator_name = "Det. Rivera";
    data.incident_date = "2024-02-29";

    // Act
    std::int64_t id = CaseRepository(*db_).create_case(data);
    auto c = CaseRepository(*db_).get_case(id);

    // Assert
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->case_number, "CASE-2024-0001");
    EXPECT_EQ(c->case_name, "Harbor burglary");
    EXPECT_EQ(c->investigator_name.value_or(""), "Det. Rivera");
    EXPECT_FALSE(c->agency_name.has_value());
    EXPECT_EQ(c->status, CaseStatus::Open);
    EXPECT_EQ(c->total_files, 0);
    EXPECT_EQ(c->created_date.size(), 19u);
}

TEST_F(RepositoryTest, CreateCase_DuplicateNumber) {
    make_case("CASE-2024-0001");

    try {
        make_case("CASE-2024-0001");
        FAIL() << "expected DuplicateCaseNumber";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateCaseNumber);
    }
    EXPECT_EQ(CaseRepository(*db_).list_cases().size(), 1u);
}

TEST_F(RepositoryTest, ListCases_ByStatus) {
    CaseRepository cases(*db_);
    std::int64_t a = make_case("A-1");
    make_case("B-1");
    ASSERT_TRUE(cases.set_status(a, CaseStatus::Closed));

    EXPECT_EQ(cases.list_cases().size(), 2u);
    auto open = cases.list_cases(CaseStatus::Open);
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].case_number, "B-1");
    EXPECT_EQ(cases.list_cases(CaseStatus::Closed).size(), 1u);
}

TEST_F(RepositoryTest, UpdateCase_OnlyGivenFields) {
    CaseRepository cases(*db_);
    NewCase data;
    data.case_number = "U-1";
    data.case_name = "Original";
    data.agency_name = "Metro PD";
    std::int64_t id = cases.create_case(data);

    CaseUpdate update;
    update.notes = "suspect identified";
    EXPECT_TRUE(cases.update_case(id, update));
    EXPECT_FALSE(cases.update_case(id + 100, update));

    auto c = cases.get_case(id);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->case_name, "Original");
    EXPECT_EQ(c->agency_name.value_or(""), "Metro PD");
    EXPECT_EQ(c->notes.value_or(""), "suspect identified");
}

TEST_F(RepositoryTest, NextCaseNumber_PerYear) {
    CaseRepository cases(*db_);
    EXPECT_EQ(cases.next_case_number(2024), "CASE-2024-0001");

    make_case("CASE-2024-0001");
    make_case("CASE-2024-0007");
    make_case("CASE-2023-0042");
    make_case("CASE-2024-manual");

    EXPECT_EQ(cases.next_case_number(2024), "CASE-2024-0008");
    EXPECT_EQ(cases.next_case_number(2023), "CASE-2023-0043");
    EXPECT_EQ(cases.next_case_number(2025), "CASE-2025-0001");
}

TEST_F(RepositoryTest, RecountStatistics_Idempotent) {
    // Arrange
    CaseRepository cases(*db_);
    FileRepository files(*db_);
    std::int64_t id = make_case("S-1");
    std::int64_t f1 = files.add_file(make_file(id, "a.jpg"));
    files.add_file(make_file(id, "b.jpg"));
    files.add_file(make_file(id, "c.jpg"));
    files.flag(f1, "weapon visible");

    // Счётчики не меняются до пересчёта
    EXPECT_EQ(cases.get_case(id)->total_files, 0);

    // Act
    EXPECT_TRUE(cases.recount_statistics(id));
    EXPECT_TRUE(cases.recount_statistics(id));

    // Assert
    auto c = cases.get_case(id);
    EXPECT_EQ(c->total_files, 3);
    EXPECT_EQ(c->total_flagged, 1);
    EXPECT_FALSE(cases.recount_statistics(id + 100));
}

TEST_F(RepositoryTest, Statistics_Aggregates) {
    CaseRepository cases(*db_);
    FileRepository files(*db_);
    std::int64_t id = make_case("S-2");

    EvidenceFile a = make_file(id, "a.jpg");
    a.date_taken = "2024-03-01 10:00:00";
    EvidenceFile b = make_file(id, "b.jpg");
    b.date_taken = "2024-03-01 10:00:00";
    std::int64_t fa = files.add_file(a);
    files.add_file(b);
    files.add_file(make_file(id, "c.pdf", taxonomy::Category::Document));

    AnalysisUpdate update;
    update.face_count = 2;
    files.update_analysis(fa, update);

    CaseStatistics s = cases.statistics(id);
    EXPECT_EQ(s.total_files, 3);
    EXPECT_EQ(s.processed_files, 1);
    EXPECT_EQ(s.files_with_faces, 1);
    EXPECT_EQ(s.total_faces, 2);
    EXPECT_EQ(s.unique_dates, 1);
    EXPECT_EQ(s.flagged_files, 0);
}

// ==============================================================================
// TST-FILE-001: файлы улик
// ==============================================================================

TEST_F(RepositoryTest, AddFile_UnknownCase_IsForeignKeyViolation) {
    try {
        FileRepository(*db_).add_file(make_file(999, "orphan.jpg"));
        FAIL() << "expected ForeignKeyViolation";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ForeignKeyViolation);
    }
}

TEST_F(RepositoryTest, AddFile_RoundTripOptionalFields) {
    FileRepository files(*db_);
    std::int64_t id = make_case("F-1");
    EvidenceFile f = make_file(id, "IMG_0001.jpg");
    f.source_archive = "/evidence/phone.zip";
    f.gps_latitude = 40.7128;
    f.camera_make = "Apple";

    std::int64_t file_id = files.add_file(f);
    auto stored = files.get_file(file_id);

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->file_name, "IMG_0001.jpg");
    EXPECT_EQ(stored->file_type, taxonomy::Category::Image);
    EXPECT_EQ(stored->source_archive.value_or(""), "/evidence/phone.zip");
    EXPECT_DOUBLE_EQ(stored->gps_latitude.value_or(0.0), 40.7128);
    EXPECT_FALSE(stored->gps_longitude.has_value());
    EXPECT_FALSE(stored->ai_processed);
    EXPECT_TRUE(stored->ai_tags.empty());
    EXPECT_FALSE(stored->file_hash.has_value());
    EXPECT_FALSE(files.get_file(file_id + 1).has_value());
}

TEST_F(RepositoryTest, FlagAndUnflag_ChangeTogether) {
    FileRepository files(*db_);
    std::int64_t id = make_case("F-2");
    std::int64_t file_id = files.add_file(make_file(id, "a.jpg"));

    EXPECT_TRUE(files.flag(file_id, "contraband"));
    auto flagged = files.get_file(file_id);
    EXPECT_TRUE(flagged->is_flagged);
    EXPECT_EQ(flagged->flag_reason.value_or(""), "contraband");
    EXPECT_EQ(files.get_files_by_case(id, true).size(), 1u);

    EXPECT_TRUE(files.unflag(file_id));
    auto cleared = files.get_file(file_id);
    EXPECT_FALSE(cleared->is_flagged);
    EXPECT_FALSE(cleared->flag_reason.has_value());
    EXPECT_TRUE(files.get_files_by_case(id, true).empty());

    EXPECT_FALSE(files.flag(file_id + 100, "x"));
}

TEST_F(RepositoryTest, AddNote_Replaces) {
    FileRepository files(*db_);
    std::int64_t file_id = files.add_file(make_file(make_case("F-3"), "a.jpg"));

    files.add_note(file_id, "first");
    files.add_note(file_id, "second");

    EXPECT_EQ(files.get_file(file_id)->analyst_notes.value_or(""), "second");
}

TEST_F(RepositoryTest, SetHash_ValidatesDigest) {
    FileRepository files(*db_);
    std::int64_t id = make_case("F-4");
    std::int64_t f1 = files.add_file(make_file(id, "a.jpg"));
    files.add_file(make_file(id, "b.jpg"));
    EXPECT_EQ(files.files_missing_hash(id).size(), 2u);

    EXPECT_TRUE(files.set_hash(f1, sample_hash()));
    try {
        files.set_hash(f1, "ABC");
        FAIL() << "expected Database error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Database);
    }

    EXPECT_EQ(files.get_file(f1)->file_hash.value_or(""), sample_hash());
    auto missing = files.files_missing_hash(id);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].file_name, "b.jpg");
}

TEST_F(RepositoryTest, UpdateAnalysis_KeepsMetadataWhenNull) {
    // Arrange
    FileRepository files(*db_);
    std::int64_t id = make_case("F-5");
    EvidenceFile f = make_file(id, "a.jpg");
    f.camera_model = "iPhone 12";
    std::int64_t file_id = files.add_file(f);
    EXPECT_EQ(files.count_unprocessed(id), 1);

    AnalysisUpdate update;
    update.ai_tags = {"person", "car"};
    update.ai_confidence = 0.9;
    update.ocr_text = "INVOICE 42";
    update.date_taken = "2024-03-01 10:00:00";

    // Act
    EXPECT_TRUE(files.update_analysis(file_id, update));

    // Assert
    auto stored = files.get_file(file_id);
    EXPECT_TRUE(stored->ai_processed);
    EXPECT_EQ(stored->ai_tags, (std::vector<std::string>{"person", "car"}));
    EXPECT_EQ(stored->ocr_text.value_or(""), "INVOICE 42");
    EXPECT_EQ(stored->date_taken.value_or(""), "2024-03-01 10:00:00");
    EXPECT_EQ(stored->camera_model.value_or(""), "iPhone 12");
    EXPECT_TRUE(stored->analyzed_date.has_value());
    EXPECT_EQ(files.count_unprocessed(id), 0);
    EXPECT_TRUE(files.get_unprocessed_files(id).empty());
}

TEST_F(RepositoryTest, FilesByCase_DateTakenDescNullsLast) {
    FileRepository files(*db_);
    std::int64_t id = make_case("F-6");
    EvidenceFile old_file = make_file(id, "old.jpg");
    old_file.date_taken = "2020-01-01 00:00:00";
    EvidenceFile new_file = make_file(id, "new.jpg");
    new_file.date_taken = "2024-01-01 00:00:00";
    files.add_file(make_file(id, "undated.jpg"));
    files.add_file(old_file);
    files.add_file(new_file);

    auto list = files.get_files_by_case(id);

    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].file_name, "new.jpg");
    EXPECT_EQ(list[1].file_name, "old.jpg");
    EXPECT_EQ(list[2].file_name, "undated.jpg");
}

// ==============================================================================
// TST-FILE-002: фильтр
// ==============================================================================

TEST_F(RepositoryTest, FilterFiles_Combined) {
    // Arrange
    FileRepository files(*db_);
    std::int64_t id = make_case("F-7");

    EvidenceFile march = make_file(id, "march.jpg");
    march.date_taken = "2024-03-15 09:00:00";
    EvidenceFile april = make_file(id, "april.jpg");
    april.date_taken = "2024-04-02 18:00:00";
    EvidenceFile doc = make_file(id, "scan.pdf", taxonomy::Category::Document);
    doc.date_taken = "2024-03-20 12:00:00";

    std::int64_t m = files.add_file(march);
    files.add_file(april);
    std::int64_t d = files.add_file(doc);
    files.add_file(make_file(id, "undated.jpg"));

    AnalysisUpdate faces;
    faces.face_count = 1;
    faces.ai_tags = {"Person"};
    files.update_analysis(m, faces);

    AnalysisUpdate ocr;
    ocr.ocr_text = "Payment Invoice #7";
    files.update_analysis(d, ocr);

    // Act / Assert: диапазон дат, обе границы включительно
    FileFilter range;
    range.date_from = "2024-03-01";
    range.date_to = "2024-03-31";
    EXPECT_EQ(files.filter_files(id, range).size(), 2u);

    // Одна граница
    FileFilter from_only;
    from_only.date_from = "2024-04-02";
    auto after = files.filter_files(id, from_only);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].file_name, "april.jpg");

    FileFilter by_type;
    by_type.file_type = taxonomy::Category::Document;
    EXPECT_EQ(files.filter_files(id, by_type).size(), 1u);

    FileFilter with_faces;
    with_faces.has_faces = true;
    EXPECT_EQ(files.filter_files(id, with_faces).size(), 1u);

    FileFilter text;
    text.text_contains = "invoice";
    auto hits = files.filter_files(id, text);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].file_name, "scan.pdf");

    FileFilter tag;
    tag.tag_contains = "person";
    EXPECT_EQ(files.filter_files(id, tag).size(), 1u);

    EXPECT_EQ(files.filter_files(id, FileFilter{}).size(), 4u);
}

TEST(TagsJsonTest, RoundTripAndMalformed) {
    EXPECT_EQ(tags_to_json({"a", "b \"c\""}), "[\"a\",\"b \\\"c\\\"\"]");
    EXPECT_EQ(tags_from_json("[\"x\", 1, \"y\"]"), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(tags_from_json("{not json").empty());
    EXPECT_TRUE(tags_from_json("{\"a\": 1}").empty());
}

TEST(Sha256HexTest, Format) {
    EXPECT_TRUE(is_sha256_hex(std::string(64, 'f')));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'F')));
    EXPECT_FALSE(is_sha256_hex(std::string(63, 'a')));
    EXPECT_FALSE(is_sha256_hex(std::string(63, 'a') + "g"));
}

// ==============================================================================
// TST-AUDIT-001: журнал аудита
// ==============================================================================

TEST_F(RepositoryTest, Audit_LogAndQuery) {
    // Arrange
    AuditRepository audit(*db_);
    std::int64_t a = make_case("A-1");
    std::int64_t b = make_case("B-1");

    rapidjson::Document details(rapidjson::kObjectType);
    details.AddMember("files", 12, details.GetAllocator());

    // Act
    audit.log_action("ingest", a, "Det. Rivera", &details);
    audit.log_action("flag_file", a, "Det. Rivera");
    audit.log_action("ingest", b, "System");
    audit.log_action("startup", std::nullopt, "System");

    // Assert
    auto case_a = audit.case_logs(a);
    ASSERT_EQ(case_a.size(), 2u);
    EXPECT_EQ(case_a[0].action, "flag_file");
    EXPECT_FALSE(case_a[0].details.has_value());
    EXPECT_EQ(case_a[1].details.value_or(""), "{\"files\":12}");
    EXPECT_EQ(case_a[1].user_name, "Det. Rivera");

    EXPECT_EQ(audit.logs_by_action("ingest").size(), 2u);
    auto all = audit.all_logs();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_FALSE(all[0].case_id.has_value());
    EXPECT_EQ(audit.all_logs(2).size(), 2u);
}

}  // namespace evidex::store::test
