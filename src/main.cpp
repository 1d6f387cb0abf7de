#include <getopt.h>
#include <strings.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>

#include "hyprsnap.hpp"
#include "ipc/Control.hpp"

static void help() {
    std::cout << "Hyprsnap usage: hyprsnap [arg [...]].\n\nArguments:\n"
              << " -a | --no-copy           | Do not copy the picked color to the clipboard\n"
              << " -f | --format=fmt        | Specifies the output format (cmyk, hex, rgb, rgba, hsl, hsv, css)\n"
              << " -n | --notify            | Sends a desktop notification when a color is picked (requires notify-send)\n"
              << " -l | --lowercase-hex     | Outputs the hexcode in lowercase\n"
              << " -o | --once              | Pick one color right away and exit (0 picked, 2 cancelled, 1 failed)\n"
              << " -k | --hotkey-label=txt  | Label for the pick shortcut (default " << HOTKEY_LABEL_DEFAULT << ")\n"
              << " -r | --rate=hz           | Preview updates per second, 1 - 60 (default " << PICK_TICK_RATE_DEFAULT << ")\n"
              << " -z | --zoom-size=px      | Edge of the magnified block in screen pixels, odd, 3 - 61 (default " << PREVIEW_BLOCK_DEFAULT << ")\n"
              << " -m | --magnification=x   | Zoom factor of the preview, 4 - 40 (default " << PREVIEW_MAG_DEFAULT << ")\n"
              << " -j | --json-events       | Print pick mode events as JSON lines on stdout\n"
              << " -H | --history=path      | Color history file\n"
              << " -S | --socket=path       | Control socket\n"
              << " -s | --send=command      | Send a command to the running instance and print the reply\n"
              << " -b | --no-fancy          | Disables the \"fancy\" (aka. colored) outputting\n"
              << " -q | --quiet             | Disable most logs (leaves errors)\n"
              << " -v | --verbose           | Enable more logs\n"
              << " -h | --help              | Show this help message\n"
              << " -V | --version           | Print version info\n";
}

static std::optional<int> parseInt(const char* str) {
    int        value = 0;
    const auto END   = str + strlen(str);
    const auto RES   = std::from_chars(str, END, value);

    if (RES.ec != std::errc() || RES.ptr != END)
        return std::nullopt;

    return value;
}

int main(int argc, char** argv, char** envp) {
    g_pHyprsnap = std::make_unique<CHyprsnap>();

    std::optional<std::string> sendRequest;

    while (true) {
        int                  option_index   = 0;
        static struct option long_options[] = {{"no-copy", no_argument, nullptr, 'a'},
                                               {"format", required_argument, nullptr, 'f'},
                                               {"notify", no_argument, nullptr, 'n'},
                                               {"lowercase-hex", no_argument, nullptr, 'l'},
                                               {"once", no_argument, nullptr, 'o'},
                                               {"hotkey-label", required_argument, nullptr, 'k'},
                                               {"rate", required_argument, nullptr, 'r'},
                                               {"zoom-size", required_argument, nullptr, 'z'},
                                               {"magnification", required_argument, nullptr, 'm'},
                                               {"json-events", no_argument, nullptr, 'j'},
                                               {"history", required_argument, nullptr, 'H'},
                                               {"socket", required_argument, nullptr, 'S'},
                                               {"send", required_argument, nullptr, 's'},
                                               {"no-fancy", no_argument, nullptr, 'b'},
                                               {"quiet", no_argument, nullptr, 'q'},
                                               {"verbose", no_argument, nullptr, 'v'},
                                               {"help", no_argument, nullptr, 'h'},
                                               {"version", no_argument, nullptr, 'V'},
                                               {nullptr, 0, nullptr, 0}};

        int                  c = getopt_long(argc, argv, ":f:k:r:z:m:H:S:s:anlojbqvhV", long_options, &option_index);
        if (c == -1)
            break;

        switch (c) {
            case 'f': {
                const auto MODE = outputModeFromString(optarg);
                if (!MODE) {
                    std::cerr << "Invalid format " << optarg << "\n";
                    return 1;
                }
                g_pHyprsnap->m_bSelectedOutputMode = *MODE;
                break;
            }
            case 'r':
            case 'z':
            case 'm': {
                const auto VALUE = parseInt(optarg);
                if (!VALUE || *VALUE <= 0) {
                    std::cerr << "Expected a positive number, got " << optarg << "\n";
                    return 1;
                }

                if (c == 'r')
                    g_pHyprsnap->m_sPickConfig.tickRate = *VALUE;
                else if (c == 'z')
                    g_pHyprsnap->m_sPickConfig.previewSize = *VALUE;
                else
                    g_pHyprsnap->m_sPickConfig.magnification = *VALUE;
                break;
            }
            case 'k': g_pHyprsnap->m_sHotkeyLabel = optarg; break;
            case 'H': g_pHyprsnap->m_sHistoryPath = optarg; break;
            case 'S': g_pHyprsnap->m_sSocketPath = optarg; break;
            case 's': sendRequest = optarg; break;
            case 'a': g_pHyprsnap->m_bAutoCopy = false; break;
            case 'n': g_pHyprsnap->m_bNotify = true; break;
            case 'l': g_pHyprsnap->m_bUseLowerCase = true; break;
            case 'o': g_pHyprsnap->m_bOneShot = true; break;
            case 'j': g_pHyprsnap->m_bJsonEvents = true; break;
            case 'b': g_pHyprsnap->m_bFancyOutput = false; break;
            case 'q': Debug::quiet = true; break;
            case 'v': Debug::verbose = true; break;
            case 'h': help(); exit(0);
            case 'V': {
                std::cout << "hyprsnap v" << HYPRSNAP_VERSION << " (commit " << GIT_COMMIT_HASH << ", branch " << GIT_BRANCH << ")\n";
                exit(0);
            }
            case ':': std::cerr << "Missing value for " << argv[optind - 1] << "\n"; return 1;

            default: help(); exit(1);
        }
    }

    if (sendRequest)
        return NControl::send(g_pHyprsnap->m_sSocketPath.empty() ? NControl::defaultSocketPath() : g_pHyprsnap->m_sSocketPath, *sendRequest);

    // json consumers read stdout, keep it free of escape codes
    const auto NOCOLOR = getenv("NO_COLOR");
    if (!isatty(fileno(stdout)) || (NOCOLOR && NOCOLOR[0] != '\0') || g_pHyprsnap->m_bJsonEvents)
        g_pHyprsnap->m_bFancyOutput = false;

    const auto CODE = g_pHyprsnap->init();
    g_pHyprsnap.reset();

    return CODE;
}
