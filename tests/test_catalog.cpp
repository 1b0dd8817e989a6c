//
// Created by Giuseppe Francione on 16/10/26.
//

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../libdatacat/include/catalog.hpp"
#include "../libdatacat/include/events.hpp"
#include "../libdatacat/include/sqlite_store.hpp"
#include <csignal>
#include <set>
#include <stdexcept>
#include <tuple>

using namespace datacat;
using namespace datacat::test;

namespace {

std::string content(const std::string& time, const std::int64_t mp = 8, const std::string& extra = {}) {
    return "time=" + time + "\nmp=" + std::to_string(mp) + "\nradar=Isen\n" + extra;
}

CatalogConfig manual(const bool recheck = false, const unsigned threads = 1) {
    CatalogConfig config;
    config.sync = false;
    config.recheck = recheck;
    config.threads = threads;
    return config;
}

std::string note_of(const Catalog& catalog) {
    const auto handles = catalog.latest(1);
    if (handles.empty()) return {};
    const auto note = handles.front().attribute("note");
    return note ? attribute_to_string(*note) : std::string{};
}

std::atomic<Catalog*> signal_target{nullptr};

void stop_on_signal(int) {
    if (Catalog* c = signal_target.load()) c->stop();
}

} // namespace

class CatalogTest : public ::testing::Test {
protected:
    Catalog open(const CatalogConfig config = {}) {
        return Catalog::open(root, db, product, config);
    }

    TempDir dir;
    fs::path root = dir.path() / "data";
    fs::path db = dir.path() / "catalog.db";
    std::shared_ptr<std::atomic<int>> parses = std::make_shared<std::atomic<int>>(0);
    ProductSchema product = make_test_product(parses);
};

TEST_F(CatalogTest, EmptyRootYieldsEmptyCatalog) {
    fs::create_directories(root);
    auto catalog = open(manual());
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.files_scanned, 0u);
    EXPECT_EQ(summary.fatal, 0u);
    EXPECT_TRUE(catalog.files().empty());
    EXPECT_EQ(catalog.dataset_count(), 0u);
    EXPECT_FALSE(catalog.reference().empty());
    EXPECT_EQ(catalog.product().name, "test");
}

TEST_F(CatalogTest, CompanionFilesMergeIntoOneDataset) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "b.ca", content("2019-05-28 12:00:00"));
    auto catalog = open();

    const auto datasets = catalog.datasets();
    ASSERT_EQ(datasets.size(), 1u);
    EXPECT_EQ(datasets[0].roles.size(), 2u);
    EXPECT_EQ(datasets[0].roles.at("primary").path.filename(), "a.pri");
    EXPECT_EQ(datasets[0].roles.at("companionA").path.filename(), "b.ca");
}

TEST_F(CatalogTest, CompanionFirstMergesTheSame) {
    write_file(root / "a.ca", content("2019-05-28 12:00:00"));
    write_file(root / "b.pri", content("2019-05-28 12:00:00"));
    auto catalog = open(manual());
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.datasets_created, 1u);
    EXPECT_EQ(summary.datasets_updated, 1u);
    ASSERT_EQ(catalog.dataset_count(), 1u);
    EXPECT_EQ(catalog.datasets()[0].roles.size(), 2u);
}

TEST_F(CatalogTest, SecondSyncIsNoOp) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "a.ca", content("2019-05-28 12:00:00"));
    write_file(root / "x" / "b.pri", content("2019-05-28 12:05:00"));
    auto catalog = open();
    ASSERT_EQ(parses->load(), 3);
    const auto files = catalog.files();
    const auto datasets = catalog.datasets();

    const auto summary = catalog.sync();
    EXPECT_EQ(parses->load(), 3);
    EXPECT_EQ(summary.files_accepted, 0u);
    EXPECT_EQ(summary.files_skipped, 3u);
    EXPECT_EQ(catalog.files(), files);
    EXPECT_EQ(catalog.datasets(), datasets);
}

TEST_F(CatalogTest, RecheckSkipsUnmodifiedFiles) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "b.pri", content("2019-05-28 12:05:00"));
    auto catalog = open(manual(true));
    catalog.sync();
    ASSERT_EQ(parses->load(), 2);

    catalog.sync();
    EXPECT_EQ(parses->load(), 2);
}

TEST_F(CatalogTest, ModifiedFileNeedsRecheck) {
    const auto file = write_file(root / "a.pri", content("2019-05-28 12:00:00", 8, "note=first\n"));
    { auto catalog = open(); }

    write_file(file, content("2019-05-28 12:00:00", 8, "note=second\n"));
    touch_future(file);
    {
        auto catalog = open();
        EXPECT_EQ(note_of(catalog), "first");
    }
    {
        auto catalog = open(manual(true));
        const auto summary = catalog.sync();
        EXPECT_EQ(summary.files_accepted, 1u);
        EXPECT_EQ(summary.datasets_updated, 1u);
        EXPECT_EQ(note_of(catalog), "second");
        EXPECT_EQ(catalog.dataset_count(), 1u);
    }
}

TEST_F(CatalogTest, ModifiedIdentityMovesFileToNewDataset) {
    const auto file = write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open(manual(true));
    catalog.sync();

    write_file(file, content("2019-05-28 12:05:00"));
    touch_future(file);
    catalog.sync();

    const auto datasets = catalog.datasets();
    ASSERT_EQ(datasets.size(), 1u);
    EXPECT_EQ(datasets[0].key.time, at("2019-05-28 12:05:00"));
    EXPECT_EQ(catalog.dataset_count(), 2u);
}

TEST_F(CatalogTest, ModifiedFileTurningCorruptLeavesDataset) {
    const auto file = write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open(manual(true));
    catalog.sync();

    write_file(file, "garbage");
    touch_future(file);
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.files_corrupt, 1u);
    EXPECT_TRUE(catalog.datasets().empty());
    ASSERT_EQ(catalog.files().size(), 1u);
    EXPECT_EQ(catalog.files()[0].kind, kCorruptKind);
}

TEST_F(CatalogTest, MovedFileOverwritesRole) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    { auto catalog = open(); }

    write_file(root / "moved" / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open(manual());
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.fatal, 0u);
    EXPECT_EQ(summary.datasets_updated, 1u);
    const auto datasets = catalog.datasets();
    ASSERT_EQ(datasets.size(), 1u);
    EXPECT_EQ(datasets[0].roles.at("primary").path.parent_path().filename(), "moved");
}

TEST_F(CatalogTest, DuplicateIdentityAbortsSync) {
    write_file(root / "b.pri", content("2019-05-28 11:00:00"));
    { auto catalog = open(); }

    IdentityKey key;
    key.time = at("2019-05-28 12:00:00");
    key.end_time = key.time;
    key.mp_id = 8;
    key.radar = "Isen";
    {
        SqliteStore store(db);
        for (int i = 0; i < 2; ++i) {
            store.prepare("INSERT INTO dataset(identity, time, end_time, mp_id, radar) VALUES(?, ?, ?, ?, ?);")
                .bind(1, key.canonical())
                .bind(2, to_unix(key.time))
                .bind(3, to_unix(key.end_time))
                .bind(4, std::int64_t{8})
                .bind(5, "Isen")
                .run();
        }
    }

    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "c.pri", content("2019-05-28 13:00:00"));
    auto catalog = open(manual());

    std::vector<SyncErrorEvent> errors;
    catalog.events().subscribe<SyncErrorEvent>([&](const SyncErrorEvent& e) { errors.push_back(e); });

    try {
        catalog.sync();
        FAIL() << "expected DuplicateDatasetError";
    } catch (const DuplicateDatasetError& e) {
        EXPECT_EQ(e.matches(), 2u);
        EXPECT_EQ(e.summary().fatal, 1u);
        EXPECT_EQ(e.summary().files_scanned, 3u);
        EXPECT_EQ(e.summary().fault_path.filename(), "a.pri");
    }
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].path.filename(), "a.pri");

    const auto files = catalog.files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path.filename(), "b.pri");
    EXPECT_EQ(catalog.dataset_count(), 3u);
}

TEST_F(CatalogTest, LatestOnSingleDataset) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open();
    EXPECT_EQ(catalog.latest(3).size(), 1u);
}

TEST_F(CatalogTest, QueriesReturnHandles) {
    write_file(root / "a.pri", content("2019-05-28 11:55:00"));
    write_file(root / "b.pri", content("2019-05-28 12:00:00"));
    write_file(root / "c.pri", content("2019-05-28 12:00:00", 10));
    auto catalog = open();

    QueryFilter thompson;
    thompson.mp_id = 8;
    EXPECT_EQ(catalog.closest(at("2019-05-28 11:58:00"), thompson).time(), at("2019-05-28 12:00:00"));
    EXPECT_EQ(catalog.closest(at("2019-05-28 11:57:30"), thompson).time(), at("2019-05-28 11:55:00"));
    EXPECT_EQ(catalog.range(at("2019-05-28 11:00:00"), at("2019-05-28 13:00:00")).size(), 3u);
    EXPECT_EQ(catalog.range(at("2019-05-28 11:00:00"), at("2019-05-28 13:00:00"), thompson).size(), 2u);

    QueryFilter morrison;
    morrison.mp_id = 10;
    EXPECT_EQ(catalog.latest(5, morrison).size(), 1u);

    QueryFilter bin;
    bin.mp_id = 30;
    EXPECT_THROW((void)catalog.closest(at("2019-05-28 11:00:00"), bin), NotFoundError);
}

TEST_F(CatalogTest, CorruptFilesAreRecordedNotLinked) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "bad.pri", "garbage");
    write_file(root / "empty.ca", "");
    auto catalog = open(manual());

    std::vector<fs::path> corrupt;
    catalog.events().subscribe<FileCorruptEvent>([&](const FileCorruptEvent& e) { corrupt.push_back(e.path); });
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.files_corrupt, 2u);
    EXPECT_EQ(summary.files_accepted, 1u);
    EXPECT_EQ(corrupt.size(), 2u);
    EXPECT_EQ(catalog.files().size(), 3u);
    EXPECT_EQ(catalog.dataset_count(), 1u);

    // corrupt files are not retried without recheck
    const auto again = catalog.sync();
    EXPECT_EQ(again.files_parsed, 0u);
}

TEST_F(CatalogTest, UnrecognizedAndMalformedNamesAreSkipped) {
    write_file(root / "readme.txt", "hello");
    write_file(root / ".DS_Store", "junk");
    write_file(root / "strict_abc.st", content("2019-05-28 12:00:00"));
    write_file(root / "strict_12.st", content("2019-05-28 12:00:00"));
    auto catalog = open(manual());
    const auto summary = catalog.sync();

    EXPECT_EQ(summary.files_scanned, 4u);
    EXPECT_EQ(summary.files_skipped, 3u);
    EXPECT_EQ(summary.files_accepted, 1u);
    ASSERT_EQ(catalog.files().size(), 1u);
    EXPECT_EQ(catalog.files()[0].kind, "strict");
}

TEST_F(CatalogTest, ParallelParsingMatchesSerial) {
    for (const int mp : {8, 10, 28}) {
        for (int step = 0; step < 6; ++step) {
            const auto time = format_time(at("2019-05-28 12:00:00") + std::chrono::minutes{5 * step});
            const std::string stem = "MP" + std::to_string(mp) + "/" + std::to_string(step);
            write_file(root / (stem + ".pri"), content(time, mp));
            write_file(root / (stem + ".ca"), content(time, mp, "note=" + stem + "\n"));
        }
    }
    write_file(root / "broken.pri", "garbage");

    const auto project = [](const Catalog& catalog) {
        std::vector<std::tuple<std::string, std::string, std::string>> out;
        for (const auto& d : catalog.datasets()) {
            out.emplace_back(d.key.canonical(), d.roles.at("primary").path.string(), d.attributes.at("note"));
        }
        return out;
    };

    auto serial = Catalog::open(root, dir.path() / "serial.db", product, manual(false, 1));
    auto parallel = Catalog::open(root, dir.path() / "parallel.db", product, manual(false, 4));
    const auto s1 = serial.sync();
    const auto s4 = parallel.sync();

    EXPECT_EQ(s1.files_accepted, s4.files_accepted);
    EXPECT_EQ(s1.files_corrupt, 1u);
    EXPECT_EQ(s4.files_corrupt, 1u);
    EXPECT_EQ(s4.datasets_created, 18u);
    EXPECT_EQ(project(serial), project(parallel));
}

TEST_F(CatalogTest, StopDuringWalkRollsBack) {
    write_file(root / "0junk.txt", "x");
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open(manual());

    bool stopped = false;
    catalog.events().subscribe<FileSkippedEvent>([&](const FileSkippedEvent&) {
        if (!stopped) {
            stopped = true;
            catalog.stop();
        }
    });

    const auto summary = catalog.sync();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(catalog.files().empty());

    const auto retry = catalog.sync();
    EXPECT_FALSE(retry.cancelled);
    EXPECT_EQ(catalog.files().size(), 1u);
}

TEST_F(CatalogTest, StopDuringLinkRollsBack) {
    for (const char* name : {"a.pri", "b.pri", "c.pri"}) {
        write_file(root / name, content("2019-05-28 12:00:00"));
    }
    auto catalog = open(manual(false, 2));
    catalog.events().subscribe<FileIndexedEvent>([&](const FileIndexedEvent&) { catalog.stop(); });

    const auto summary = catalog.sync();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.files_accepted, 1u);
    EXPECT_TRUE(catalog.files().empty());
    EXPECT_EQ(catalog.dataset_count(), 0u);
}

TEST_F(CatalogTest, StopAfterLastWalkedFileCancelsBeforeParsing) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "b.pri", content("2019-05-28 13:00:00"));
    write_file(root / "zz.txt", "x");
    auto catalog = open(manual(false, 2));
    catalog.events().subscribe<FileSkippedEvent>([&](const FileSkippedEvent& e) {
        if (e.path.filename() == "zz.txt") catalog.stop();
    });

    SyncSummary summary;
    ASSERT_NO_THROW(summary = catalog.sync());
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.files_scanned, 3u);
    EXPECT_EQ(summary.files_parsed, 0u);
    EXPECT_EQ(parses->load(), 0);
    EXPECT_TRUE(catalog.files().empty());
}

TEST_F(CatalogTest, StopFromSignalHandlerCancels) {
    for (int h = 10; h < 16; ++h) {
        write_file(root / ("f" + std::to_string(h) + ".pri"),
                   content("2019-05-28 " + std::to_string(h) + ":00:00"));
    }
    auto catalog = open(manual(false, 4));
    signal_target = &catalog;
    const auto previous = std::signal(SIGUSR1, stop_on_signal);
    ASSERT_NE(previous, SIG_ERR);
    catalog.events().subscribe<FileIndexedEvent>([](const FileIndexedEvent&) { std::raise(SIGUSR1); });

    const auto summary = catalog.sync();
    std::signal(SIGUSR1, previous);
    signal_target = nullptr;

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.files_accepted, 1u);
    EXPECT_TRUE(catalog.files().empty());
    EXPECT_EQ(catalog.dataset_count(), 0u);
}

TEST_F(CatalogTest, ObserverSeesProgress) {
    struct Recorder : CatalogObserver {
        int started = 0;
        int finished = 0;
        std::set<std::string> roles;
        std::vector<fs::path> skipped;
        void onSyncStart(const fs::path&) override { ++started; }
        void onFileIndexed(const fs::path&, const std::string& role, bool) override { roles.insert(role); }
        void onFileSkipped(const fs::path& path, const std::string&) override { skipped.push_back(path); }
        void onSyncFinish(const SyncSummary&) override { ++finished; }
    } recorder;

    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    write_file(root / "a.ca", content("2019-05-28 12:00:00"));
    write_file(root / "notes.txt", "x");
    auto catalog = open(manual());
    catalog.setObserver(&recorder);
    catalog.sync();
    catalog.setObserver(nullptr);

    EXPECT_EQ(recorder.started, 1);
    EXPECT_EQ(recorder.finished, 1);
    EXPECT_EQ(recorder.roles, (std::set<std::string>{"primary", "companionA"}));
    ASSERT_EQ(recorder.skipped.size(), 1u);
    EXPECT_EQ(recorder.skipped[0].filename(), "notes.txt");
}

TEST_F(CatalogTest, StoreThatCannotBeOpenedFails) {
    fs::create_directories(root);
    EXPECT_THROW((void)Catalog::open(root, dir.path(), product), OpenError);

    const auto garbage = write_file(dir.path() / "garbage.db", std::string(4096, 'x'));
    EXPECT_THROW((void)Catalog::open(root, garbage, product), OpenError);
}

TEST_F(CatalogTest, StoreIsBoundToProduct) {
    fs::create_directories(root);
    { auto catalog = open(); }
    EXPECT_THROW((void)Catalog::open(root, db, make_wrf_product()), OpenError);
}

TEST_F(CatalogTest, ClosedCatalogRejectsCalls) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto catalog = open();
    ASSERT_TRUE(catalog.is_open());
    catalog.close();

    EXPECT_FALSE(catalog.is_open());
    EXPECT_THROW((void)catalog.latest(1), std::logic_error);
    EXPECT_THROW(catalog.sync(), std::logic_error);
    EXPECT_NO_THROW(catalog.close());
}

TEST_F(CatalogTest, MovedCatalogKeepsWorking) {
    write_file(root / "a.pri", content("2019-05-28 12:00:00"));
    auto first = open();
    Catalog second = std::move(first);
    EXPECT_EQ(second.latest(1).size(), 1u);
    EXPECT_THROW((void)first.latest(1), std::logic_error);
}

TEST(CatalogProducts, WrfFilesMergeByTimeAndDomain) {
    const TempDir dir;
    const fs::path root = dir.path() / "wrf";
    for (const char* kind : {"wrfout", "wrfmp", "clouds"}) {
        write_file(root / "MP8" / (std::string(kind) + "_d03_2019-05-28_120000"), "CDF");
    }
    write_file(root / "MP8" / "wrfout_d02_2019-05-28_120000", "CDF");
    write_file(root / "MP8" / "wrfout_d03_2019-05-28_120000.tmp_broken", "");
    write_file(root / "MP8" / "namelist.input", "&time_control");

    auto catalog = Catalog::open(root, dir.path() / "wrf.db", make_wrf_product());
    ASSERT_EQ(catalog.dataset_count(), 2u);

    QueryFilter munich;
    munich.domain = "d03";
    const auto h = catalog.closest(at("2019-05-28 12:00:00"), munich);
    EXPECT_EQ(h.files().size(), 3u);
    EXPECT_EQ(std::get<std::string>(*h.attribute("domain")), "Munich");
    EXPECT_EQ(std::get<std::int64_t>(*h.attribute("mp_id")), 8);
}
