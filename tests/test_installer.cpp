#include <gtest/gtest.h>
#include "core/installer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

class InstallerTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::unique_ptr<VersionStore> store;
    LocalServer server;

    const std::string app_script = "#!/bin/sh\necho hello\n";

    void SetUp() override {
        test_dir = make_test_dir("installer");
        store = std::make_unique<VersionStore>(test_dir + "/data/current.json", test_dir + "/versions");
    }

    void TearDown() override {
        server.stop();
        fs::remove_all(test_dir);
    }

    /// Serve body at path
    void serve(const std::string& path, const std::string& body) {
        server.routes().Get(path, [body](const httplib::Request&, httplib::Response& res) {
            res.set_content(body, "application/octet-stream");
        });
    }

    InstallOptions options() {
        InstallOptions opts;
        opts.executable = "app";
        opts.connect_timeout_sec = 5;
        opts.read_timeout_sec = 5;
        return opts;
    }

    UpdateDescriptor descriptor(const std::string& path, const std::string& body, VersionTag v = {1, 1, 0}) {
        UpdateDescriptor d;
        d.version = v;
        d.download_url = server.url() + path;
        d.sha256 = sha256_of(body);
        d.size = static_cast<int64_t>(body.size());
        return d;
    }
};

// ── Helpers ─────────────────────────────────────────────────

TEST_F(InstallerTest, Sha256OfKnownInput) {
    write_file(test_dir + "/abc.txt", "abc");
    EXPECT_EQ(Installer::sha256_file(test_dir + "/abc.txt"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_TRUE(Installer::sha256_file(test_dir + "/missing").empty());
}

TEST_F(InstallerTest, PackageKindFromUrl) {
    EXPECT_EQ(Installer::package_kind("https://h/app-1.0.0.zip"), PackageKind::Zip);
    EXPECT_EQ(Installer::package_kind("https://h/app-1.0.0.ZIP?token=1"), PackageKind::Zip);
    EXPECT_EQ(Installer::package_kind("https://h/app-1.0.0.tar.gz"), PackageKind::TarGz);
    EXPECT_EQ(Installer::package_kind("https://h/app-1.0.0.tgz#frag"), PackageKind::TarGz);
    EXPECT_EQ(Installer::package_kind("https://h/app"), PackageKind::Executable);
}

TEST_F(InstallerTest, ParseUrl) {
    auto p = Installer::parse_url("https://example.com/path/to/file");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "example.com");
    EXPECT_EQ(p.port, 443);
    EXPECT_EQ(p.path, "/path/to/file");

    p = Installer::parse_url("http://127.0.0.1:8080/a");
    EXPECT_EQ(p.scheme, "http");
    EXPECT_EQ(p.host, "127.0.0.1");
    EXPECT_EQ(p.port, 8080);
    EXPECT_EQ(p.path, "/a");

    p = Installer::parse_url("http://host");
    EXPECT_EQ(p.port, 80);
    EXPECT_EQ(p.path, "/");

    p = Installer::parse_url("http://host:port/a");
    EXPECT_TRUE(p.host.empty());
}

TEST_F(InstallerTest, FindExecutableRecurses) {
    write_file(test_dir + "/tree/bin/app", "x");
    write_file(test_dir + "/tree/app.txt", "x");
    EXPECT_EQ(Installer::find_executable(test_dir + "/tree", "app"),
              (fs::path(test_dir) / "tree" / "bin" / "app").string());
    EXPECT_TRUE(Installer::find_executable(test_dir + "/tree", "other").empty());
    EXPECT_TRUE(Installer::find_executable(test_dir + "/missing", "app").empty());
}

// ── Full install ────────────────────────────────────────────

TEST_F(InstallerTest, InstallBareExecutable) {
    serve("/artifacts/app", app_script);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto desc = descriptor("/artifacts/app", app_script);

    int64_t last_received = 0;
    auto r = installer.install(desc, [&](int64_t received, int64_t) { last_received = received; });
    ASSERT_TRUE(r.success) << r.message;

    VersionTag v{1, 1, 0};
    EXPECT_TRUE(store->is_finalized(v));
    EXPECT_FALSE(fs::exists(store->staging_dir(v)));
    EXPECT_EQ(last_received, static_cast<int64_t>(app_script.size()));

    std::string exe = store->version_dir(v) + "/app";
    EXPECT_EQ(read_file(exe), app_script);
    EXPECT_EQ(access(exe.c_str(), X_OK), 0);
    EXPECT_FALSE(fs::exists(store->version_dir(v) + "/.package"));
}

TEST_F(InstallerTest, InstallTarball) {
    write_file(test_dir + "/src/bin/app", app_script);
    write_file(test_dir + "/src/share/readme.txt", "readme");
    std::string tarball = test_dir + "/app.tar.gz";
    ASSERT_EQ(std::system(("tar czf '" + tarball + "' -C '" + test_dir + "/src' bin share").c_str()), 0);
    std::string body = read_file(tarball);

    serve("/artifacts/app-1.1.0.tar.gz", body);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto r = installer.install(descriptor("/artifacts/app-1.1.0.tar.gz", body));
    ASSERT_TRUE(r.success) << r.message;

    std::string dir = store->version_dir(VersionTag{1, 1, 0});
    EXPECT_EQ(read_file(dir + "/bin/app"), app_script);
    EXPECT_EQ(read_file(dir + "/share/readme.txt"), "readme");
    EXPECT_EQ(access((dir + "/bin/app").c_str(), X_OK), 0);
    EXPECT_FALSE(fs::exists(dir + "/.package"));
}

TEST_F(InstallerTest, TarballWithoutExecutableFails) {
    write_file(test_dir + "/src/readme.txt", "no binary here");
    std::string tarball = test_dir + "/app.tar.gz";
    ASSERT_EQ(std::system(("tar czf '" + tarball + "' -C '" + test_dir + "/src' readme.txt").c_str()), 0);
    std::string body = read_file(tarball);

    serve("/artifacts/app.tgz", body);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto r = installer.install(descriptor("/artifacts/app.tgz", body));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::InstallFailed);
    EXPECT_TRUE(tree_of(store->versions_dir()).empty());
}

TEST_F(InstallerTest, DigestMismatchDiscardsStaging) {
    serve("/artifacts/app", app_script);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto desc = descriptor("/artifacts/app", app_script);
    desc.sha256 = sha256_of("something else");

    auto r = installer.install(desc);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::VerificationFailed);
    EXPECT_FALSE(fs::exists(store->staging_dir(desc.version)));
    EXPECT_FALSE(store->is_finalized(desc.version));
}

TEST_F(InstallerTest, UppercaseDigestIsAccepted) {
    serve("/artifacts/app", app_script);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto desc = descriptor("/artifacts/app", app_script);
    std::transform(desc.sha256.begin(), desc.sha256.end(), desc.sha256.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto r = installer.install(desc);
    EXPECT_TRUE(r.success) << r.message;
}

TEST_F(InstallerTest, SizeMismatchFailsVerification) {
    serve("/artifacts/app", app_script);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto desc = descriptor("/artifacts/app", app_script);
    desc.size += 1;

    auto r = installer.install(desc);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::VerificationFailed);
    EXPECT_NE(r.message.find("size"), std::string::npos);
}

TEST_F(InstallerTest, MissingArtifactFailsDownload) {
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    auto r = installer.install(descriptor("/artifacts/nope", app_script));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::InstallFailed);
    EXPECT_NE(r.message.find("404"), std::string::npos);
    EXPECT_TRUE(tree_of(store->versions_dir()).empty());
}

TEST_F(InstallerTest, CancelDuringDownload) {
    std::string big(1024 * 1024, 'x');
    serve("/artifacts/app", big);
    ASSERT_TRUE(server.start());

    Installer installer(*store, options());
    std::atomic<bool> cancel{false};
    auto r = installer.install(descriptor("/artifacts/app", big),
                               [&](int64_t, int64_t) { cancel.store(true); }, &cancel);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::Cancelled);
    EXPECT_TRUE(tree_of(store->versions_dir()).empty());
}

TEST_F(InstallerTest, StageReplacesStaleStaging) {
    VersionTag v{1, 1, 0};
    write_file(store->staging_dir(v) + "/junk", "left over");

    Installer installer(*store, options());
    ASSERT_TRUE(installer.stage(v).success);
    EXPECT_TRUE(fs::is_directory(store->staging_dir(v)));
    EXPECT_FALSE(fs::exists(store->staging_dir(v) + "/junk"));
}

TEST_F(InstallerTest, FinalizeReplacesStaleTarget) {
    VersionTag v{1, 1, 0};
    write_file(store->version_dir(v) + "/stale", "old");
    write_file(store->staging_dir(v) + "/app", app_script);

    Installer installer(*store, options());
    ASSERT_TRUE(installer.finalize(v).success);
    EXPECT_TRUE(fs::exists(store->version_dir(v) + "/app"));
    EXPECT_FALSE(fs::exists(store->version_dir(v) + "/stale"));
    EXPECT_FALSE(fs::exists(store->staging_dir(v)));
    EXPECT_FALSE(fs::exists(store->retired_dir(v)));
}

TEST_F(InstallerTest, RecoverRemovesRetiredDirectories) {
    write_file(store->retired_dir(VersionTag{1, 1, 0}) + "/lib/part.so", "half deleted");
    write_file(store->version_dir(VersionTag{1, 0, 0}) + "/app", app_script);

    Installer installer(*store, options());
    auto cleaned = installer.recover();
    ASSERT_EQ(cleaned.size(), 1u);
    EXPECT_EQ(cleaned[0], (VersionTag{1, 1, 0}));
    EXPECT_FALSE(fs::exists(store->retired_dir(VersionTag{1, 1, 0})));
    EXPECT_TRUE(store->is_finalized(VersionTag{1, 0, 0}));
}

TEST_F(InstallerTest, RecoverRemovesLeftovers) {
    write_file(store->staging_dir(VersionTag{1, 1, 0}) + "/.package", "partial");
    write_file(store->staging_dir(VersionTag{1, 2, 0}) + "/app", "expanded");
    write_file(store->version_dir(VersionTag{1, 0, 0}) + "/app", app_script);

    Installer installer(*store, options());
    auto cleaned = installer.recover();
    EXPECT_EQ(cleaned.size(), 2u);
    EXPECT_TRUE(store->list_staging_directories().empty());
    EXPECT_TRUE(store->is_finalized(VersionTag{1, 0, 0}));
}
