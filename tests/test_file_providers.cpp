#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/providers/FileExistenceProvider.h"
#include "../src/providers/FileContentPatternProvider.h"
#include "../src/providers/FileTargets.h"
#include "../src/remediation/FileActions.h"
#include "TestSupport.h"
#include <sys/stat.h>
#include <unistd.h>

namespace ioc_sweep {

using testing_support::TempDir;
using testing_support::write_file;
namespace fs = std::filesystem;

class FileProvidersTest : public ::testing::Test {
protected:
    IndicatorDefinition file_def(const std::string& path){
        IndicatorDefinition def;
        def.id = "file";
        def.provider = ProviderKind::FileExistence;
        def.args.set("path", path);
        return def;
    }
    IndicatorDefinition content_def(const std::string& path, const std::string& pattern, bool regex = false){
        IndicatorDefinition def;
        def.id = "content";
        def.provider = ProviderKind::FileContentPattern;
        def.args.set("path", path);
        def.args.set("pattern", pattern);
        if(regex) def.args.set("regex", "true");
        return def;
    }
    static unsigned mode_of(const fs::path& p){
        struct stat st{};
        if(lstat(p.c_str(), &st) != 0) return 0;
        return st.st_mode & 07777;
    }

    TempDir dir{"ioc_sweep_files"};
    FileExistenceProvider existence;
    FileContentPatternProvider content;
    ScopeContext system = ScopeContext::system();
};

TEST_F(FileProvidersTest, AnchorPathRules) {
    auto user = ScopeContext::for_user("alice", "/home/alice");
    EXPECT_EQ(anchor_path("~/Library/x", user), "/home/alice/Library/x");
    EXPECT_EQ(anchor_path("Library/x", user), "/home/alice/Library/x");
    EXPECT_EQ(anchor_path("/etc/x", user), "/etc/x");
    EXPECT_EQ(anchor_path("tmp/x", system), "/tmp/x");
}

TEST_F(FileProvidersTest, MissingFileIsAbsent) {
    auto ev = existence.query(file_def((dir / "nope").string()), system);
    EXPECT_FALSE(ev.present);
    EXPECT_FALSE(ev.query_failed);
}

TEST_F(FileProvidersTest, MissingParentDirectoryIsAbsent) {
    auto ev = existence.query(file_def((dir / "no/such/parent/file").string()), system);
    EXPECT_FALSE(ev.present);
    EXPECT_FALSE(ev.query_failed);
    auto globbed = existence.query(file_def((dir / "no/such/*.plist").string()), system);
    EXPECT_FALSE(globbed.present);
    EXPECT_FALSE(globbed.query_failed);
}

TEST_F(FileProvidersTest, ExistingFileIsPresentWithPathAsTarget) {
    auto p = dir / "GmaNi4v50ekNZSI";
    write_file(p, "payload");
    auto ev = existence.query(file_def(p.string()), system);
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.values, ::testing::ElementsAre(p.string()));
    EXPECT_THAT(ev.targets, ::testing::ElementsAre(p.string()));
}

TEST_F(FileProvidersTest, GlobMatchesAreSorted) {
    write_file(dir / "b.plist", "");
    write_file(dir / "a.plist", "");
    write_file(dir / "c.txt", "");
    auto ev = existence.query(file_def((dir / "*.plist").string()), system);
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.targets, ::testing::ElementsAre((dir / "a.plist").string(), (dir / "b.plist").string()));
    EXPECT_EQ(ev.metadata["match_count"], "2");
}

TEST_F(FileProvidersTest, TypeFilter) {
    fs::create_directories(dir / "Safari");
    auto def = file_def((dir / "Safari").string());
    def.args.set("type", "file");
    EXPECT_FALSE(existence.query(def, system).present);
    def.args.set("type", "directory");
    EXPECT_TRUE(existence.query(def, system).present);
}

TEST_F(FileProvidersTest, PerUserScopeResolvesAgainstHome) {
    auto home = dir / "home/alice";
    write_file(home / "Library/Preferences/com.apple.MediaToolbox.plist", "x");
    auto user = ScopeContext::for_user("alice", home.string());
    EXPECT_TRUE(existence.query(file_def("~/Library/Preferences/com.apple.MediaToolbox.plist"), user).present);
    EXPECT_FALSE(existence.query(file_def("~/Library/Preferences/com.apple.MediaToolbox.plist"),
                                 ScopeContext::for_user("bob", (dir / "home/bob").string())).present);
}

TEST_F(FileProvidersTest, ModeAttributeReportsOctalPermissions) {
    auto p = dir / "media.plist";
    write_file(p, "x");
    ASSERT_EQ(::chmod(p.c_str(), 0644), 0);
    auto def = file_def(p.string());
    def.args.set("attribute", "mode");
    auto ev = existence.query(def, system);
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.values, ::testing::ElementsAre("0644"));
    EXPECT_THAT(ev.targets, ::testing::ElementsAre(p.string()));
}

TEST_F(FileProvidersTest, Sha256AttributeAndFilter) {
    auto p = dir / "payload.bin";
    write_file(p, "abc");
    auto def = file_def(p.string());
    def.args.set("attribute", "sha256");
    auto ev = existence.query(def, system);
    if(!sha256_available()){
        EXPECT_TRUE(ev.query_failed);
        return;
    }
    const std::string abc = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.values, ::testing::ElementsAre(abc));

    auto filtered = file_def(p.string());
    filtered.args.set("sha256", abc);
    EXPECT_TRUE(existence.query(filtered, system).present);
    filtered.args.set("sha256", std::string(64, '0'));
    EXPECT_FALSE(existence.query(filtered, system).present);
}

TEST_F(FileProvidersTest, ContentSubstringMatchGivesSnippet) {
    auto p = dir / "launch.plist";
    write_file(p, "<plist>\n<string>/private/tmp/p --daemon</string>\n</plist>");
    auto ev = content.query(content_def(p.string(), "/private/tmp/p"), system);
    ASSERT_TRUE(ev.present);
    ASSERT_EQ(ev.values.size(), 1u);
    EXPECT_THAT(ev.values[0], ::testing::HasSubstr("/private/tmp/p --daemon"));
    EXPECT_THAT(ev.values[0], ::testing::Not(::testing::HasSubstr("\n")));
    EXPECT_THAT(ev.targets, ::testing::ElementsAre(p.string()));
}

TEST_F(FileProvidersTest, ContentRegexMatch) {
    auto p = dir / "script.sh";
    write_file(p, "echo aGVsbG8= | base64 -d | sh\n");
    EXPECT_TRUE(content.query(content_def(p.string(), "base64\\s+-d", true), system).present);
    EXPECT_FALSE(content.query(content_def(p.string(), "osascript", true), system).present);
}

TEST_F(FileProvidersTest, ContentRegexOnHugeSingleLineDoesNotCrash) {
    auto p = dir / "blob.bin";
    write_file(p, std::string(200000, 'a'));
    auto ev = content.query(content_def(p.string(), "(a|b)*c", true), system);
    EXPECT_FALSE(ev.query_failed);
    EXPECT_FALSE(ev.present);

    write_file(p, std::string(150000, 'a') + "\nneedle(x) here\n" + std::string(150000, 'a'));
    auto hit = content.query(content_def(p.string(), "needle\\(x\\)", true), system);
    ASSERT_TRUE(hit.present);
    EXPECT_THAT(hit.values[0], ::testing::HasSubstr("needle(x)"));
}

TEST_F(FileProvidersTest, ContentOnlyHitsAreTargets) {
    write_file(dir / "a.conf", "clean");
    write_file(dir / "b.conf", "contains EVIL marker");
    auto ev = content.query(content_def((dir / "*.conf").string(), "EVIL"), system);
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.targets, ::testing::ElementsAre((dir / "b.conf").string()));
}

TEST_F(FileProvidersTest, ContentMissingFileIsAbsent) {
    auto ev = content.query(content_def((dir / "missing.conf").string(), "x"), system);
    EXPECT_FALSE(ev.present);
    EXPECT_FALSE(ev.query_failed);
}

TEST_F(FileProvidersTest, ContentUnreadableFileFailsQuery) {
    if(geteuid() == 0) GTEST_SKIP() << "root bypasses file permissions";
    auto p = dir / "secret.conf";
    write_file(p, "EVIL");
    ASSERT_EQ(::chmod(p.c_str(), 0000), 0);
    auto ev = content.query(content_def(p.string(), "EVIL"), system);
    EXPECT_TRUE(ev.query_failed);
    EXPECT_FALSE(ev.failure_reason.empty());
}

TEST_F(FileProvidersTest, RemovePathIsIdempotent) {
    auto p = dir / "artifact";
    write_file(p, "x");
    EXPECT_EQ(remove_path(p.string(), false).status, ActionStatus::Done);
    EXPECT_FALSE(fs::exists(p));
    EXPECT_EQ(remove_path(p.string(), false).status, ActionStatus::AlreadyDone);
}

TEST_F(FileProvidersTest, RemoveDirectoryNeedsRecursive) {
    write_file(dir / "tree/sub/file", "x");
    auto r = remove_path((dir / "tree").string(), false);
    EXPECT_EQ(r.status, ActionStatus::Error);
    EXPECT_TRUE(fs::exists(dir / "tree"));
    EXPECT_EQ(remove_path((dir / "tree").string(), true).status, ActionStatus::Done);
    EXPECT_FALSE(fs::exists(dir / "tree"));
}

TEST_F(FileProvidersTest, RestoreModeIsIdempotent) {
    auto p = dir / "media.plist";
    write_file(p, "x");
    ASSERT_EQ(::chmod(p.c_str(), 0644), 0);
    EXPECT_TRUE(mode_differs(p.string(), 0600, false));
    EXPECT_EQ(restore_mode(p.string(), 0600, false).status, ActionStatus::Done);
    EXPECT_EQ(mode_of(p), 0600u);
    EXPECT_FALSE(mode_differs(p.string(), 0600, false));
    EXPECT_EQ(restore_mode(p.string(), 0600, false).status, ActionStatus::AlreadyDone);
    EXPECT_EQ(restore_mode((dir / "gone").string(), 0600, false).status, ActionStatus::AlreadyDone);
}

TEST_F(FileProvidersTest, RestoreModeRecursiveReachesChildren) {
    write_file(dir / "Safari/History.db", "x");
    write_file(dir / "Safari/Extensions/ext.plist", "x");
    ASSERT_EQ(::chmod((dir / "Safari/History.db").c_str(), 0644), 0);
    ASSERT_EQ(::chmod((dir / "Safari/Extensions/ext.plist").c_str(), 0644), 0);
    EXPECT_TRUE(mode_differs((dir / "Safari").string(), 0700, true));
    EXPECT_EQ(restore_mode((dir / "Safari").string(), 0700, true).status, ActionStatus::Done);
    EXPECT_EQ(mode_of(dir / "Safari"), 0700u);
    EXPECT_EQ(mode_of(dir / "Safari/History.db"), 0700u);
    EXPECT_EQ(mode_of(dir / "Safari/Extensions/ext.plist"), 0700u);
    EXPECT_FALSE(mode_differs((dir / "Safari").string(), 0700, true));
}

TEST_F(FileProvidersTest, ImmutableFlagOnMissingFileIsAlreadyDone) {
    EXPECT_EQ(set_immutable((dir / "missing").string()).status, ActionStatus::AlreadyDone);
    std::string err;
    EXPECT_FALSE(read_immutable_flag((dir / "missing").string(), &err).has_value());
    EXPECT_FALSE(err.empty());
}

}
