#include "remote_transfer.hpp"
#include "reporter.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fstream>
#include <format>
#include <fcntl.h>
#include <sys/stat.h>

using namespace std::chrono;

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

namespace {

class SftpWriter : public RemoteWriter {
public:
    SftpWriter(sftp_file file, std::string path) : file(file), path(std::move(path)) {}
    ~SftpWriter() override {
        if (file) {
            sftp_close(file);
        }
    }

    std::expected<void, std::string> write(std::string_view data) override {
        while (!data.empty()) {
            ssize_t written = sftp_write(file, data.data(), data.size());
            if (written <= 0) {
                return std::unexpected(std::format("Failed to write remote file {}", path));
            }
            data.remove_prefix(static_cast<std::size_t>(written));
        }
        return {};
    }

    std::expected<void, std::string> close() override {
        int rc = sftp_close(file);
        file = nullptr;
        if (rc != SSH_NO_ERROR) {
            return std::unexpected(std::format("Failed to close remote file {}", path));
        }
        return {};
    }

private:
    sftp_file file;
    std::string path;
};

class SftpReader : public RemoteReader {
public:
    SftpReader(sftp_file file, std::string path) : file(file), path(std::move(path)) {}
    ~SftpReader() override { sftp_close(file); }

    std::expected<std::size_t, std::string> read(char* buffer, std::size_t size) override {
        ssize_t count = sftp_read(file, buffer, size);
        if (count < 0) {
            return std::unexpected(std::format("Failed to read remote file {}", path));
        }
        return static_cast<std::size_t>(count);
    }

private:
    sftp_file file;
    std::string path;
};

class LocalFileWriter : public RemoteWriter {
public:
    LocalFileWriter(std::ofstream stream, std::string path) : stream(std::move(stream)), path(std::move(path)) {}

    std::expected<void, std::string> write(std::string_view data) override {
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!stream) {
            return std::unexpected(std::format("Failed to write {}", path));
        }
        return {};
    }

    std::expected<void, std::string> close() override {
        stream.close();
        if (stream.fail()) {
            return std::unexpected(std::format("Failed to close {}", path));
        }
        return {};
    }

private:
    std::ofstream stream;
    std::string path;
};

class LocalFileReader : public RemoteReader {
public:
    LocalFileReader(std::ifstream stream, std::string path) : stream(std::move(stream)), path(std::move(path)) {}

    std::expected<std::size_t, std::string> read(char* buffer, std::size_t size) override {
        stream.read(buffer, static_cast<std::streamsize>(size));
        if (stream.bad()) {
            return std::unexpected(std::format("Failed to read {}", path));
        }
        return static_cast<std::size_t>(stream.gcount());
    }

private:
    std::ifstream stream;
    std::string path;
};

} // namespace

std::expected<std::unique_ptr<SftpTransport>, std::string> SftpTransport::connect(const RemoteSettings& settings, Reporter& reporter) {
    if (settings.sshKeyFile.empty() && settings.sshPassword.empty()) {
        return std::unexpected("No SSH authentication configured (ssh_key_file or ssh_password)");
    }

    std::unique_ptr<SftpTransport> transport(new SftpTransport());
    transport->ssh = ssh_new();
    if (!transport->ssh) {
        return std::unexpected("Failed to create SSH session");
    }

    ssh_session session = transport->ssh;
    int port = settings.sshPort;
    long timeout = settings.timeoutSeconds;
    ssh_options_set(session, SSH_OPTIONS_HOST, settings.sshHost.c_str());
    ssh_options_set(session, SSH_OPTIONS_PORT, &port);
    if (!settings.sshUser.empty()) {
        ssh_options_set(session, SSH_OPTIONS_USER, settings.sshUser.c_str());
    }
    ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &timeout);

    if (ssh_connect(session) != SSH_OK) {
        return std::unexpected(std::format("SSH connection to {}:{} failed: {}", settings.sshHost, port, ssh_get_error(session)));
    }

    switch (ssh_session_is_known_server(session)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            return std::unexpected(std::format("Host key for {} does not match known_hosts", settings.sshHost));
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_ERROR:
        default:
            reporter.warn(std::format("Host key for {} is not verified", settings.sshHost));
            break;
    }

    bool authenticated = false;
    if (!settings.sshKeyFile.empty()) {
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(settings.sshKeyFile.c_str(), nullptr, nullptr, nullptr, &key) != SSH_OK) {
            return std::unexpected(std::format("Failed to read private key {}", settings.sshKeyFile));
        }
        authenticated = ssh_userauth_publickey(session, nullptr, key) == SSH_AUTH_SUCCESS;
        ssh_key_free(key);
    }
    if (!authenticated && !settings.sshPassword.empty()) {
        authenticated = ssh_userauth_password(session, nullptr, settings.sshPassword.c_str()) == SSH_AUTH_SUCCESS;
    }
    if (!authenticated) {
        return std::unexpected(std::format("SSH authentication failed: {}", ssh_get_error(session)));
    }

    transport->sftp = sftp_new(session);
    if (!transport->sftp) {
        return std::unexpected(std::format("SFTP initialization failed: {}", ssh_get_error(session)));
    }
    if (sftp_init(transport->sftp) != SSH_OK) {
        return std::unexpected(std::format("SFTP initialization failed: {}", transport->lastError("sftp_init")));
    }
    return transport;
}

SftpTransport::~SftpTransport() {
    if (sftp) {
        sftp_free(sftp);
    }
    if (ssh) {
        if (ssh_is_connected(ssh)) {
            ssh_disconnect(ssh);
        }
        ssh_free(ssh);
    }
}

std::string SftpTransport::lastError(const std::string& what) const {
    return std::format("{} (sftp error {}): {}", what, sftp_get_error(sftp), ssh_get_error(ssh));
}

std::expected<void, std::string> SftpTransport::makeDirectories(const std::string& dir) {
    std::string current;
    std::size_t pos = 0;
    while (pos <= dir.size()) {
        std::size_t next = dir.find('/', pos);
        if (next == std::string::npos) {
            next = dir.size();
        }
        current = dir.substr(0, next);
        pos = next + 1;
        if (current.empty() || current == "." || current.back() == '/') {
            continue;
        }
        if (sftp_attributes attributes = sftp_stat(sftp, current.c_str())) {
            sftp_attributes_free(attributes);
            continue;
        }
        if (sftp_mkdir(sftp, current.c_str(), 0755) != SSH_OK && sftp_get_error(sftp) != SSH_FX_FILE_ALREADY_EXISTS) {
            return std::unexpected(lastError(std::format("Failed to create remote directory {}", current)));
        }
    }
    return {};
}

std::expected<std::vector<RemoteEntry>, std::string> SftpTransport::list(const std::string& dir) {
    sftp_dir handle = sftp_opendir(sftp, dir.c_str());
    if (!handle) {
        if (sftp_get_error(sftp) == SSH_FX_NO_SUCH_FILE) {
            return std::vector<RemoteEntry>{};
        }
        return std::unexpected(lastError(std::format("Failed to list remote directory {}", dir)));
    }

    std::vector<RemoteEntry> entries;
    while (sftp_attributes attributes = sftp_readdir(sftp, handle)) {
        if (attributes->type == SSH_FILEXFER_TYPE_REGULAR && attributes->name) {
            entries.push_back({attributes->name,
                               system_clock::time_point{seconds{attributes->mtime}},
                               static_cast<std::uintmax_t>(attributes->size)});
        }
        sftp_attributes_free(attributes);
    }
    bool complete = sftp_dir_eof(handle) == 1;
    sftp_closedir(handle);
    if (!complete) {
        return std::unexpected(lastError(std::format("Failed to read remote directory {}", dir)));
    }
    return entries;
}

std::expected<std::unique_ptr<RemoteWriter>, std::string> SftpTransport::create(const std::string& path) {
    sftp_file file = sftp_open(sftp, path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (!file) {
        return std::unexpected(lastError(std::format("Failed to open remote file {} for writing", path)));
    }
    return std::make_unique<SftpWriter>(file, path);
}

std::expected<std::unique_ptr<RemoteReader>, std::string> SftpTransport::open(const std::string& path) {
    sftp_file file = sftp_open(sftp, path.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(lastError(std::format("Failed to open remote file {}", path)));
    }
    return std::make_unique<SftpReader>(file, path);
}

std::expected<void, std::string> SftpTransport::remove(const std::string& path) {
    if (sftp_unlink(sftp, path.c_str()) != SSH_OK) {
        return std::unexpected(lastError(std::format("Failed to remove remote file {}", path)));
    }
    return {};
}

std::expected<void, std::string> LocalDirectoryTransport::makeDirectories(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create directory {}: {}", dir, ec.message()));
    }
    return {};
}

std::expected<std::vector<RemoteEntry>, std::string> LocalDirectoryTransport::list(const std::string& dir) {
    std::vector<RemoteEntry> entries;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return entries;
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statError;
        if (!it->is_regular_file(statError)) {
            continue;
        }
        auto lastWrite = it->last_write_time(statError);
        auto size = it->file_size(statError);
        if (statError) {
            continue;
        }
        entries.push_back({it->path().filename().string(),
                           time_point_cast<system_clock::duration>(file_clock::to_sys(lastWrite)),
                           size});
    }
    if (ec) {
        return std::unexpected(std::format("Failed to list directory {}: {}", dir, ec.message()));
    }
    return entries;
}

std::expected<std::unique_ptr<RemoteWriter>, std::string> LocalDirectoryTransport::create(const std::string& path) {
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return std::unexpected(std::format("Failed to open {} for writing", path));
    }
    return std::make_unique<LocalFileWriter>(std::move(stream), path);
}

std::expected<std::unique_ptr<RemoteReader>, std::string> LocalDirectoryTransport::open(const std::string& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(std::format("Failed to open {}", path));
    }
    return std::make_unique<LocalFileReader>(std::move(stream), path);
}

std::expected<void, std::string> LocalDirectoryTransport::remove(const std::string& path) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        return std::unexpected(std::format("Failed to remove {}: {}", path, ec ? ec.message() : "file does not exist"));
    }
    return {};
}

std::expected<std::unique_ptr<RemoteTransport>, std::string> makeRemoteTransport(const RemoteSettings& settings, Reporter& reporter) {
    if (!settings.enabled()) {
        return std::unexpected("Remote backup directory is not configured");
    }
    if (!settings.usesSftp()) {
        return std::make_unique<LocalDirectoryTransport>();
    }
    auto transport = SftpTransport::connect(settings, reporter);
    if (!transport) {
        return std::unexpected(transport.error());
    }
    return std::unique_ptr<RemoteTransport>(std::move(*transport));
}
