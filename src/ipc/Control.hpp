#pragma once

#include "../history/History.hpp"
#include "../picker/PickMode.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

// What a control request may touch. Both pointers may be null in tests.
struct SControlContext {
    CPickModeEngine* engine           = nullptr;
    CHistoryStore*   history          = nullptr;
    std::string      hotkeyLabel      = "";
    bool             hotkeyRegistered = false;
};

namespace NControl {
    // $XDG_RUNTIME_DIR/hyprsnap.sock
    std::string                         defaultSocketPath();

    std::pair<std::string, std::string> splitCommand(const std::string& line);

    // pick, cancel, status, hotkey, history, save <json>, remove <id>,
    // label <id> [text], clear. Always answers, {"ok":false,...} on errors.
    nlohmann::json                      handle(const std::string& line, const SControlContext& ctx);
    nlohmann::json                      errorReply(const SPickError& error);
    // handle() as one reply line
    std::string                         reply(const std::string& line, const SControlContext& ctx);

    // save, remove, label and clear write the history file
    bool                                writesHistory(const std::string& line);

    // client side of --send, prints the reply and returns the exit code
    int                                 send(const std::string& socketPath, const std::string& request);
};

// Hands a reply line back to the server. Call it on the thread that polls
// the server, at most once. Harmless after the server is gone.
using FControlReply = std::function<void(const std::string&)>;

// Unix socket, one request line in, one reply line out, then the connection
// is closed. Runs on the thread that polls its fds. The handler may answer
// later, the client is left out of pollFDs() until it does.
class CControlServer {
  public:
    CControlServer(std::string path, std::function<void(const std::string&, FControlReply)> handler);
    ~CControlServer();

    // Fails when another instance already answers on the path. A dead
    // socket file left behind by a crash is replaced.
    CPickResult<void>  listen();

    std::vector<int>   pollFDs() const;
    void               dispatch(int fd, short revents);

    const std::string& path() const;

  private:
    void                                            acceptClient();
    void                                            readClient(int fd);
    void                                            answerClient(int fd, uint64_t serial, const std::string& reply);
    void                                            closeClient(int fd);

    struct SClient {
        std::string buf;
        uint64_t    serial   = 0;
        bool        awaiting = false;
    };

    std::string                                                m_sPath;
    std::function<void(const std::string&, FControlReply)>     m_handler;
    int                                                        m_iListenFD = -1;
    std::unordered_map<int, SClient>                           m_mClients;
    uint64_t                                                   m_iNextSerial = 1;
    // replies that outlive the server see this expire
    std::shared_ptr<bool>                                      m_pAlive = std::make_shared<bool>(true);
};
