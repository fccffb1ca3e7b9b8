// Integration tests for Libssh2Transport behind a Session, against a real
// SSH server. Skipped (exit code 77) unless the SSHM_IT_* env vars exist.
#include "sshm/KnownHostsStore.hpp"
#include "sshm/Libssh2Transport.hpp"
#include "sshm/Session.hpp"
#include "sshm/TransferEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

bool listContainsName(const std::vector<sshm::DirectoryEntry> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const sshm::DirectoryEntry &e) {
                           return e.name == name;
                       });
}

} // namespace

int main() {
    const auto host = envValue("SSHM_IT_HOST");
    const auto user = envValue("SSHM_IT_USER");
    const auto pass = envValue("SSHM_IT_PASS");
    const auto keyPath = envValue("SSHM_IT_KEY");
    const auto keyPassphrase = envValue("SSHM_IT_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("SSHM_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] sshm_libssh2_integration_tests requires env vars: "
                  << "SSHM_IT_HOST, SSHM_IT_USER and one auth method "
                  << "(SSHM_IT_PASS or SSHM_IT_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SSHM_IT_KEY does not exist: " << *keyPath << "\n";
        return EXIT_FAILURE;
    }

    sshm::Endpoint endpoint;
    endpoint.host = *host;
    endpoint.login = *user;
    if (!parsePort(envValue("SSHM_IT_PORT"), endpoint.port)) {
        std::cerr << "[FAIL] SSHM_IT_PORT is invalid\n";
        return EXIT_FAILURE;
    }
    const sshm::Credential credential =
        keyPath.has_value() ? sshm::Credential::fromKeyFile(*keyPath, keyPassphrase)
                            : sshm::Credential::fromPassword(*pass);
    sshm::ConnectionOptions options;
    options.keep_alive_interval = std::chrono::seconds(5);

    const std::string token = uniqueToken();
    const fs::path localTmpRoot = fs::temp_directory_path() / ("sshm-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot / "tree" / "nested", ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message() << "\n";
        return EXIT_FAILURE;
    }
    const std::string payload = "sshm integration payload\nline-2\n";
    {
        std::ofstream a(localTmpRoot / "payload.txt", std::ios::binary);
        std::ofstream b(localTmpRoot / "tree" / "nested" / "leaf.txt",
                        std::ios::binary);
        if (!a.is_open() || !b.is_open()) {
            std::cerr << "[FAIL] could not create source files\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        a << payload;
        b << "leaf";
    }

    const std::string remoteSuiteDir = remoteBase + "/sshm-it-" + token;
    const std::string remoteSrc = remoteSuiteDir + "/payload.txt";
    const std::string remoteMoved = remoteSuiteDir + "/payload-moved.txt";

    TestContext t;
    sshm::KnownHostsStore trust((localTmpRoot / "known_hosts").string());
    sshm::Session session(std::make_unique<sshm::Libssh2Transport>(), trust);
    sshm::Error err;

    t.check(!session.connect(endpoint, credential, options, err) &&
                err.kind == sshm::ErrorKind::HostKeyVerificationRequired,
            "first connect should ask for host key verification");
    t.check(err.host_key.has_value() && !err.host_key->fingerprint.empty(),
            "host key fingerprint should be reported");
    err.clear();
    t.check(session.connectWithAcceptedKey(endpoint, credential, options, err),
            "connect with accepted key should succeed: " + err.describe());

    sshm::TransferEngine engine;
    if (t.failures == 0)
        t.check(engine.open(session.transport(), err),
                "engine open should succeed: " + err.describe());
    if (t.failures == 0)
        t.check(engine.createRemoteDirectory(remoteSuiteDir, err),
                "mkdir remoteSuiteDir should succeed: " + err.describe());
    if (t.failures == 0)
        t.check(engine.uploadFile((localTmpRoot / "payload.txt").string(),
                                  remoteSrc, nullptr, err),
                "upload should succeed: " + err.describe());
    if (t.failures == 0) {
        sshm::DirectoryEntry st;
        t.check(engine.getFileInfo(remoteSrc, st, err),
                "stat(remoteSrc) should succeed: " + err.describe());
        t.check(!st.is_dir && st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        std::vector<sshm::DirectoryEntry> entries;
        t.check(engine.listFiles(remoteSuiteDir, entries, err),
                "list(remoteSuiteDir) should succeed: " + err.describe());
        t.check(listContainsName(entries, "payload.txt"),
                "list should include payload.txt");
    }
    if (t.failures == 0) {
        const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
        t.check(engine.downloadFile(remoteSrc, localDst.string(), nullptr, err),
                "download should succeed: " + err.describe());
        std::string downloaded;
        t.check(readFile(localDst, downloaded) && downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        t.check(engine.copyDirectoryToRemote((localTmpRoot / "tree").string(),
                                             remoteSuiteDir + "/tree", nullptr,
                                             err),
                "directory upload should succeed: " + err.describe());
        sshm::DirectoryEntry leaf;
        t.check(engine.getFileInfo(remoteSuiteDir + "/tree/nested/leaf.txt",
                                   leaf, err) &&
                    leaf.size == 4,
                "nested file should be uploaded");
    }
    if (t.failures == 0) {
        t.check(engine.renameRemoteFile(remoteSrc, remoteMoved, err),
                "rename should succeed: " + err.describe());
        sshm::DirectoryEntry gone;
        t.check(!engine.getFileInfo(remoteSrc, gone, err) &&
                    err.kind == sshm::ErrorKind::Path,
                "old path should not exist after rename");
        err.clear();
    }
    if (t.failures == 0)
        t.check(engine.removeRemoteFile(remoteSuiteDir, err),
                "recursive remove should succeed: " + err.describe());

    // Best-effort cleanup regardless of test result.
    if (engine.isOpen()) {
        sshm::Error cleanupErr;
        if (!engine.removeRemoteFile(remoteSuiteDir, cleanupErr) &&
            cleanupErr.kind != sshm::ErrorKind::Path)
            std::cerr << "[WARN] cleanup: " << cleanupErr.describe() << "\n";
        cleanupErr.clear();
        if (!engine.close(cleanupErr))
            std::cerr << "[WARN] engine close: " << cleanupErr.describe() << "\n";
    }
    sshm::Error discErr;
    t.check(session.disconnect(discErr),
            "disconnect should succeed: " + discErr.describe());

    // The recorded key is now trusted.
    err.clear();
    t.check(session.connect(endpoint, credential, options, err),
            "reconnect with trusted key should succeed: " + err.describe());
    discErr.clear();
    t.check(session.disconnect(discErr), "second disconnect should succeed");
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sshm_libssh2_integration_tests\n";
    return EXIT_SUCCESS;
}
