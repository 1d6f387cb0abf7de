#include "Control.hpp"
#include "Events.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

// a full history with labels is a few dozen kB
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;
constexpr int    CLIENT_TIMEOUT_MS = 1000;

std::string NControl::defaultSocketPath() {
    const auto XDGRUNTIMEDIR = getenv("XDG_RUNTIME_DIR");
    if (!XDGRUNTIMEDIR || XDGRUNTIMEDIR[0] != '/')
        return std::format("/tmp/hyprsnap-{}.sock", getuid());

    return std::string(XDGRUNTIMEDIR) + "/hyprsnap.sock";
}

std::pair<std::string, std::string> NControl::splitCommand(const std::string& line) {
    const auto START = line.find_first_not_of(" \t");
    if (START == std::string::npos)
        return {"", ""};

    auto trimmed = line.substr(START);
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r'))
        trimmed.pop_back();

    const auto SPACE = trimmed.find_first_of(" \t");
    if (SPACE == std::string::npos)
        return {trimmed, ""};

    const auto ARGSTART = trimmed.find_first_not_of(" \t", SPACE);
    return {trimmed.substr(0, SPACE), ARGSTART == std::string::npos ? "" : trimmed.substr(ARGSTART)};
}

nlohmann::json NControl::errorReply(const SPickError& error) {
    return nlohmann::json{{"ok", false}, {"error", error.message}, {"kind", errorKindName(error.kind)}};
}

static nlohmann::json okReply() {
    return nlohmann::json{{"ok", true}};
}

static nlohmann::json resultReply(const CPickResult<void>& res) {
    return res ? okReply() : NControl::errorReply(res.error());
}

nlohmann::json NControl::handle(const std::string& line, const SControlContext& ctx) {
    const auto [COMMAND, ARGS] = splitCommand(line);

    const auto NEEDENGINE = [&]() -> std::optional<nlohmann::json> {
        if (!ctx.engine)
            return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "pick mode is not available"});
        return std::nullopt;
    };

    const auto NEEDHISTORY = [&]() -> std::optional<nlohmann::json> {
        if (!ctx.history)
            return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "history is not available"});
        return std::nullopt;
    };

    if (COMMAND.empty())
        return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "empty request"});

    if (COMMAND == "pick") {
        if (auto err = NEEDENGINE())
            return *err;

        const bool ARMED = ctx.engine->arm();
        auto       reply = okReply();
        reply["armed"]   = ARMED;
        reply["state"]   = pickStateName(ctx.engine->state());
        return reply;
    }

    if (COMMAND == "cancel") {
        if (auto err = NEEDENGINE())
            return *err;

        auto reply         = okReply();
        reply["cancelled"] = ctx.engine->cancel();
        return reply;
    }

    if (COMMAND == "status") {
        auto reply     = okReply();
        reply["state"] = ctx.engine ? pickStateName(ctx.engine->state()) : "unavailable";
        reply["hotkey"] = {{"label", ctx.hotkeyLabel}, {"registered", ctx.hotkeyRegistered}};
        if (ctx.history)
            reply["history"] = {{"count", ctx.history->size()}, {"path", ctx.history->path()}};
        return reply;
    }

    if (COMMAND == "hotkey") {
        auto reply          = okReply();
        reply["label"]      = ctx.hotkeyLabel;
        reply["registered"] = ctx.hotkeyRegistered;
        return reply;
    }

    if (COMMAND == "history") {
        if (auto err = NEEDHISTORY())
            return *err;

        auto reply       = okReply();
        reply["entries"] = *ctx.history->snapshot();
        return reply;
    }

    if (COMMAND == "save") {
        if (auto err = NEEDHISTORY())
            return *err;

        const auto DOC = nlohmann::json::parse(ARGS, nullptr, false);
        if (DOC.is_discarded() || !DOC.is_array())
            return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "save expects a JSON array of entries"});

        size_t     skipped = 0;
        const auto ENTRIES = CHistoryStore::entriesFromJson(DOC, &skipped);

        if (auto res = ctx.history->replace(ENTRIES); !res)
            return errorReply(res.error());

        auto reply       = okReply();
        reply["count"]   = ctx.history->size();
        reply["skipped"] = skipped;
        return reply;
    }

    if (COMMAND == "remove") {
        if (auto err = NEEDHISTORY())
            return *err;

        if (ARGS.empty())
            return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "usage: remove <id>"});

        return resultReply(ctx.history->remove(splitCommand(ARGS).first));
    }

    if (COMMAND == "label") {
        if (auto err = NEEDHISTORY())
            return *err;

        const auto [ID, TEXT] = splitCommand(ARGS);
        if (ID.empty())
            return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = "usage: label <id> [text]"});

        return resultReply(ctx.history->relabel(ID, TEXT));
    }

    if (COMMAND == "clear") {
        if (auto err = NEEDHISTORY())
            return *err;

        return resultReply(ctx.history->clear());
    }

    return errorReply(SPickError{.kind = PICK_ERROR_INVALID_ARGUMENT, .message = std::format("unknown command {}", COMMAND)});
}

std::string NControl::reply(const std::string& line, const SControlContext& ctx) {
    return NEvents::dump(handle(line, ctx));
}

bool NControl::writesHistory(const std::string& line) {
    const auto COMMAND = splitCommand(line).first;
    return COMMAND == "save" || COMMAND == "remove" || COMMAND == "label" || COMMAND == "clear";
}

static bool fillAddress(const std::string& path, sockaddr_un& addr) {
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (path.size() >= sizeof(addr.sun_path))
        return false;

    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

int NControl::send(const std::string& socketPath, const std::string& request) {
    sockaddr_un addr;
    if (!fillAddress(socketPath, addr)) {
        Debug::log(CRIT, "Socket path %s is too long", socketPath.c_str());
        return 1;
    }

    const int FD = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (FD < 0) {
        Debug::log(CRIT, "socket() failed: %s", strerror(errno));
        return 1;
    }

    if (connect(FD, (sockaddr*)&addr, sizeof(addr)) != 0) {
        Debug::log(CRIT, "Couldn't reach hyprsnap at %s: %s. Is it running?", socketPath.c_str(), strerror(errno));
        close(FD);
        return 1;
    }

    const std::string LINE = request + "\n";
    size_t            sent = 0;
    while (sent < LINE.size()) {
        const auto RET = write(FD, LINE.data() + sent, LINE.size() - sent);
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            Debug::log(CRIT, "Couldn't send the request: %s", strerror(errno));
            close(FD);
            return 1;
        }
        sent += RET;
    }

    shutdown(FD, SHUT_WR);

    std::string reply;
    char        buf[4096];
    while (true) {
        const auto RET = read(FD, buf, sizeof(buf));
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            Debug::log(CRIT, "Couldn't read the reply: %s", strerror(errno));
            close(FD);
            return 1;
        }
        if (RET == 0)
            break;
        reply.append(buf, RET);
    }

    close(FD);

    while (!reply.empty() && reply.back() == '\n')
        reply.pop_back();

    Debug::log(NONE, "%s", reply.c_str());

    const auto DOC = nlohmann::json::parse(reply, nullptr, false);
    if (DOC.is_discarded() || !DOC.is_object())
        return 1;

    return DOC.value("ok", false) ? 0 : 1;
}

CControlServer::CControlServer(std::string path, std::function<void(const std::string&, FControlReply)> handler) : m_sPath(std::move(path)), m_handler(handler) {
    ;
}

CControlServer::~CControlServer() {
    m_pAlive.reset();

    for (auto& [fd, client] : m_mClients) {
        close(fd);
    }
    m_mClients.clear();

    if (m_iListenFD >= 0) {
        close(m_iListenFD);
        unlink(m_sPath.c_str());
    }
}

const std::string& CControlServer::path() const {
    return m_sPath;
}

CPickResult<void> CControlServer::listen() {
    sockaddr_un addr;
    if (!fillAddress(m_sPath, addr))
        return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("socket path {} is too long", m_sPath));

    struct stat st;
    if (lstat(m_sPath.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode))
            return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("{} exists and is not a socket", m_sPath));

        const int PEER = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (PEER >= 0) {
            const bool ALIVE = connect(PEER, (sockaddr*)&addr, sizeof(addr)) == 0;
            close(PEER);

            if (ALIVE)
                return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("another hyprsnap is already listening on {}", m_sPath));
        }

        Debug::log(LOG, "Removing stale socket %s", m_sPath.c_str());
        unlink(m_sPath.c_str());
    }

    m_iListenFD = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (m_iListenFD < 0)
        return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("socket() failed: {}", strerror(errno)));

    if (bind(m_iListenFD, (sockaddr*)&addr, sizeof(addr)) != 0 || ::listen(m_iListenFD, 8) != 0) {
        const auto MSG = std::format("couldn't listen on {}: {}", m_sPath, strerror(errno));
        close(m_iListenFD);
        m_iListenFD = -1;
        return pickError(PICK_ERROR_INVALID_ARGUMENT, MSG);
    }

    chmod(m_sPath.c_str(), 0600);

    Debug::log(LOG, "Control socket listening on %s", m_sPath.c_str());

    return {};
}

std::vector<int> CControlServer::pollFDs() const {
    std::vector<int> fds;
    if (m_iListenFD < 0)
        return fds;

    fds.push_back(m_iListenFD);
    for (auto& [fd, client] : m_mClients) {
        if (!client.awaiting)
            fds.push_back(fd);
    }

    return fds;
}

void CControlServer::dispatch(int fd, short revents) {
    if (fd == m_iListenFD) {
        if (revents & POLLIN)
            acceptClient();
        return;
    }

    if (!m_mClients.contains(fd) || m_mClients[fd].awaiting)
        return;

    if (revents & (POLLIN | POLLHUP))
        readClient(fd);
    else if (revents & (POLLERR | POLLNVAL))
        closeClient(fd);
}

void CControlServer::acceptClient() {
    while (true) {
        const int CLIENT = accept4(m_iListenFD, nullptr, nullptr, SOCK_CLOEXEC);
        if (CLIENT < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                Debug::log(ERR, "Control socket: accept failed: %s", strerror(errno));
            return;
        }

        // replies are written in one go, a stuck client must not stall the loop
        timeval tv = {.tv_sec = CLIENT_TIMEOUT_MS / 1000, .tv_usec = (CLIENT_TIMEOUT_MS % 1000) * 1000};
        setsockopt(CLIENT, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        m_mClients[CLIENT] = SClient{.serial = m_iNextSerial++};
    }
}

void CControlServer::readClient(int fd) {
    auto& client = m_mClients[fd];
    auto& buf    = client.buf;

    char  chunk[4096];
    const auto RET = read(fd, chunk, sizeof(chunk));

    if (RET < 0) {
        if (errno == EINTR || errno == EAGAIN)
            return;
        Debug::log(WARN, "Control socket: read failed: %s", strerror(errno));
        closeClient(fd);
        return;
    }

    buf.append(chunk, RET);

    const auto NEWLINE = buf.find('\n');
    if (NEWLINE == std::string::npos && RET != 0) {
        if (buf.size() > MAX_REQUEST_SIZE) {
            Debug::log(WARN, "Control socket: dropping a client with a request over %zu bytes", MAX_REQUEST_SIZE);
            closeClient(fd);
        }
        return;
    }

    // EOF without a newline still counts as a request
    const auto LINE = NEWLINE == std::string::npos ? buf : buf.substr(0, NEWLINE);

    if (LINE.find_first_not_of(" \t\r") == std::string::npos && RET == 0) {
        closeClient(fd);
        return;
    }

    Debug::log(TRACE, "Control socket: request %s", LINE.substr(0, 64).c_str());

    client.awaiting = true;

    const std::weak_ptr<bool> ALIVE  = m_pAlive;
    const auto                SERIAL = client.serial;
    m_handler(LINE, [this, ALIVE, fd, SERIAL](const std::string& reply) {
        if (ALIVE.expired())
            return;
        answerClient(fd, SERIAL, reply);
    });
}

void CControlServer::answerClient(int fd, uint64_t serial, const std::string& reply) {
    // the fd may have been closed and reused since
    const auto IT = m_mClients.find(fd);
    if (IT == m_mClients.end() || IT->second.serial != serial)
        return;

    const std::string LINE = reply + "\n";

    size_t            sent = 0;
    while (sent < LINE.size()) {
        const auto W = write(fd, LINE.data() + sent, LINE.size() - sent);
        if (W < 0) {
            if (errno == EINTR)
                continue;
            Debug::log(WARN, "Control socket: couldn't write the reply: %s", strerror(errno));
            break;
        }
        sent += W;
    }

    closeClient(fd);
}

void CControlServer::closeClient(int fd) {
    m_mClients.erase(fd);
    close(fd);
}
