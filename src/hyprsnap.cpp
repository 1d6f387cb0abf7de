#include "hyprsnap.hpp"
#include "ipc/Events.hpp"

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <format>
#include <linux/input-event-codes.h>

static void sigHandler(int sig) {
    if (!g_pHyprsnap)
        return;

    g_pHyprsnap->m_bRunning = false;
    g_pHyprsnap->wake();
}

static cairo_status_t readPNGChunk(void* closure, unsigned char* data, unsigned int length) {
    auto* src = (std::pair<const std::vector<uint8_t>*, size_t>*)closure;

    if (src->second + length > src->first->size())
        return CAIRO_STATUS_READ_ERROR;

    memcpy(data, src->first->data() + src->second, length);
    src->second += length;
    return CAIRO_STATUS_SUCCESS;
}

static void roundedRect(cairo_t* cr, double x, double y, double width, double height, double radius) {
    cairo_new_path(cr);
    cairo_move_to(cr, x + radius, y);
    cairo_arc(cr, x + width - radius, y + radius, radius, -M_PI_2, 0);
    cairo_arc(cr, x + width - radius, y + height - radius, radius, 0, M_PI_2);
    cairo_arc(cr, x + radius, y + height - radius, radius, M_PI_2, M_PI);
    cairo_arc(cr, x + radius, y + radius, radius, M_PI, -M_PI_2);
    cairo_close_path(cr);
}

int CHyprsnap::init() {
    m_pXKBContext = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!m_pXKBContext)
        Debug::log(ERR, "Failed to create xkb context");

    m_pWLDisplay = wl_display_connect(nullptr);

    if (!m_pWLDisplay) {
        Debug::log(CRIT, "No wayland compositor running!");
        return 1;
    }

    m_iWakeFD = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (m_iWakeFD < 0) {
        Debug::log(CRIT, "eventfd failed: %s", strerror(errno));
        return 1;
    }

    signal(SIGTERM, sigHandler);
    signal(SIGINT, sigHandler);

    bindGlobals();

    wl_display_roundtrip(m_pWLDisplay);

    if (!m_pCompositor || !m_pSHM || !m_pLayerShell) {
        Debug::log(CRIT, "wl_compositor, wl_shm and zwlr_layer_shell_v1 are all required, can't proceed");
        shutdown();
        return 1;
    }

    if (!m_pScreencopyMgr) {
        Debug::log(CRIT, "zwlr_screencopy_v1 not supported, can't proceed");
        shutdown();
        return 1;
    }

    if (!m_pXDGOutputMgr)
        Debug::log(WARN, "zxdg_output_manager_v1 not supported, monitor layout is guessed from wl_output");

    if (!m_pFractionalMgr) {
        Debug::log(WARN, "wp_fractional_scale_v1 not supported, fractional scaling won't work");
        m_bNoFractional = true;
    }
    if (!m_pViewporter) {
        Debug::log(WARN, "wp_viewporter not supported, fractional scaling won't work");
        m_bNoFractional = true;
    }

    for (auto& m : m_vMonitors) {
        m->initXDGOutput(m_pXDGOutputMgr);
    }

    wl_display_roundtrip(m_pWLDisplay);

    onMonitorsChanged();

    m_pHistory = std::make_unique<CHistoryStore>(m_sHistoryPath.empty() ? CHistoryStore::defaultPath() : m_sHistoryPath);
    if (const auto LOADED = m_pHistory->load(); !LOADED)
        Debug::log(ERR, "History: %s", LOADED.error().message.c_str());

    m_pScreenSource = makeShared<CScreencopySource>(m_pScreencopyMgr, [this]() { wake(); });
    m_pEngine       = std::make_unique<CPickModeEngine>(m_pScreenSource, this, this, m_sPickConfig);
    m_pEngine->previews().setWakeCallback([this]() { wake(); });

    if (m_bOneShot)
        armPick();
    else {
        auto shortcut = CGlobalShortcut::registerShortcut(m_pGlobalShortcutsMgr, m_sHotkeyLabel, [this]() { handleHotkey(); });

        if (!shortcut) {
            if (!m_bHotkeyFailureLogged)
                Debug::log(ERR, "%s: %s. Pick mode is still reachable with `hyprsnap --send pick`.", errorKindName(shortcut.error().kind), shortcut.error().message.c_str());
            m_bHotkeyFailureLogged = true;
        } else
            m_pShortcut = *shortcut;

        m_pPersistence = std::make_unique<CWorkQueue>();
        m_pControl     = std::make_unique<CControlServer>(m_sSocketPath.empty() ? NControl::defaultSocketPath() : m_sSocketPath,
                                                      [this](const std::string& line, FControlReply reply) { handleControl(line, reply); });

        if (const auto RES = m_pControl->listen(); !RES) {
            Debug::log(CRIT, "%s", RES.error().message.c_str());
            shutdown();
            return 1;
        }

        Debug::log(LOG, "hyprsnap ready, %zu monitor(s), %zu colors in history", m_vMonitors.size(), m_pHistory->size());
    }

    eventLoop();

    shutdown();

    return m_iExitCode;
}

void CHyprsnap::bindGlobals() {
    m_pRegistry = makeShared<CCWlRegistry>((wl_proxy*)wl_display_get_registry(m_pWLDisplay));
    m_pRegistry->setGlobal([this](CCWlRegistry* r, uint32_t name, const char* interface, uint32_t version) {
        if (strcmp(interface, wl_compositor_interface.name) == 0) {
            m_pCompositor = makeShared<CCWlCompositor>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wl_compositor_interface, 4));
        } else if (strcmp(interface, wl_shm_interface.name) == 0) {
            m_pSHM = makeShared<CCWlShm>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wl_shm_interface, 1));
        } else if (strcmp(interface, wl_output_interface.name) == 0) {
            const auto PMONITOR = m_vMonitors
                                      .emplace_back(std::make_unique<SMonitor>(
                                          makeShared<CCWlOutput>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wl_output_interface,
                                                                                             std::min<uint32_t>(version, 4))),
                                          name))
                                      .get();

            // outputs hotplugged later need their logical geometry too
            if (m_pXDGOutputMgr)
                PMONITOR->initXDGOutput(m_pXDGOutputMgr);
        } else if (strcmp(interface, zwlr_layer_shell_v1_interface.name) == 0) {
            m_pLayerShell = makeShared<CCZwlrLayerShellV1>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &zwlr_layer_shell_v1_interface, 1));
        } else if (strcmp(interface, wl_seat_interface.name) == 0) {
            m_pSeat = makeShared<CCWlSeat>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wl_seat_interface, std::min<uint32_t>(version, 7)));

            m_pSeat->setCapabilities([this](CCWlSeat* seat, uint32_t caps) {
                if (caps & WL_SEAT_CAPABILITY_POINTER) {
                    if (!m_pPointer) {
                        m_pPointer = makeShared<CCWlPointer>(m_pSeat->sendGetPointer());
                        initMouse();
                        if (m_pCursorShapeMgr)
                            m_pCursorShapeDevice = makeShared<CCWpCursorShapeDeviceV1>(m_pCursorShapeMgr->sendGetPointer(m_pPointer->resource()));
                    }
                } else {
                    Debug::log(WARN, "Seat has no pointer, picks can only be confirmed with the keyboard");
                    m_pCursorShapeDevice.reset();
                    m_pPointer.reset();
                }

                if (caps & WL_SEAT_CAPABILITY_KEYBOARD) {
                    if (!m_pKeyboard) {
                        m_pKeyboard = makeShared<CCWlKeyboard>(m_pSeat->sendGetKeyboard());
                        initKeyboard();
                    }
                } else
                    m_pKeyboard.reset();
            });

        } else if (strcmp(interface, zwlr_screencopy_manager_v1_interface.name) == 0) {
            m_pScreencopyMgr =
                makeShared<CCZwlrScreencopyManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &zwlr_screencopy_manager_v1_interface, 1));
        } else if (strcmp(interface, zxdg_output_manager_v1_interface.name) == 0) {
            m_pXDGOutputMgr = makeShared<CCZxdgOutputManagerV1>(
                (wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &zxdg_output_manager_v1_interface, std::min<uint32_t>(version, 3)));
        } else if (strcmp(interface, wp_cursor_shape_manager_v1_interface.name) == 0) {
            m_pCursorShapeMgr =
                makeShared<CCWpCursorShapeManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wp_cursor_shape_manager_v1_interface, 1));
        } else if (strcmp(interface, hyprland_global_shortcuts_manager_v1_interface.name) == 0) {
            m_pGlobalShortcutsMgr = makeShared<CCHyprlandGlobalShortcutsManagerV1>(
                (wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &hyprland_global_shortcuts_manager_v1_interface, 1));
        } else if (strcmp(interface, wp_fractional_scale_manager_v1_interface.name) == 0) {
            m_pFractionalMgr =
                makeShared<CCWpFractionalScaleManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wp_fractional_scale_manager_v1_interface, 1));
        } else if (strcmp(interface, wp_viewporter_interface.name) == 0) {
            m_pViewporter = makeShared<CCWpViewporter>((wl_proxy*)wl_registry_bind((wl_registry*)m_pRegistry->resource(), name, &wp_viewporter_interface, 1));
        }
    });

    m_pRegistry->setGlobalRemove([this](CCWlRegistry* r, uint32_t name) {
        const auto IT = std::find_if(m_vMonitors.begin(), m_vMonitors.end(), [name](const auto& m) { return m->wayland_name == name; });
        if (IT == m_vMonitors.end())
            return;

        Debug::log(LOG, "Monitor %s went away", (*IT)->name.c_str());

        if ((*IT)->pLS) {
            if (m_pLastSurface == (*IT)->pLS) {
                m_pLastSurface = nullptr;
                updateCursor();
            }
            std::erase_if(m_vLayerSurfaces, [&](const auto& ls) { return ls.get() == (*IT)->pLS; });
        }

        m_vMonitors.erase(IT);
        onMonitorsChanged();
    });
}

void CHyprsnap::eventLoop() {
    const int DISPLAYFD = wl_display_get_fd(m_pWLDisplay);

    while (m_bRunning) {
        while (wl_display_prepare_read(m_pWLDisplay) != 0) {
            if (wl_display_dispatch_pending(m_pWLDisplay) < 0) {
                Debug::log(CRIT, "Lost the connection to the compositor");
                m_iExitCode = 1;
                return;
            }
        }

        wl_display_flush(m_pWLDisplay);

        std::vector<pollfd> fds = {{.fd = DISPLAYFD, .events = POLLIN, .revents = 0}, {.fd = m_iWakeFD, .events = POLLIN, .revents = 0}};
        if (m_pControl) {
            for (const auto FD : m_pControl->pollFDs()) {
                fds.push_back({.fd = FD, .events = POLLIN, .revents = 0});
            }
        }

        if (poll(fds.data(), fds.size(), -1) < 0) {
            wl_display_cancel_read(m_pWLDisplay);

            if (errno == EINTR)
                continue;

            Debug::log(CRIT, "poll failed: %s", strerror(errno));
            m_iExitCode = 1;
            return;
        }

        if (fds[0].revents & POLLIN) {
            if (wl_display_read_events(m_pWLDisplay) < 0) {
                Debug::log(CRIT, "Lost the connection to the compositor");
                m_iExitCode = 1;
                return;
            }
        } else
            wl_display_cancel_read(m_pWLDisplay);

        if (fds[0].revents & (POLLHUP | POLLERR)) {
            Debug::log(CRIT, "The compositor closed the connection");
            m_iExitCode = 1;
            return;
        }

        if (wl_display_dispatch_pending(m_pWLDisplay) < 0) {
            Debug::log(CRIT, "Lost the connection to the compositor");
            m_iExitCode = 1;
            return;
        }

        if (fds[1].revents & POLLIN)
            processWake();

        for (size_t i = 2; i < fds.size(); ++i) {
            if (fds[i].revents && m_pControl)
                m_pControl->dispatch(fds[i].fd, fds[i].revents);
        }
    }
}

void CHyprsnap::wake() {
    if (m_iWakeFD < 0)
        return;

    const uint64_t ONE = 1;
    // EAGAIN only means a wake is already pending
    while (write(m_iWakeFD, &ONE, sizeof(ONE)) < 0 && errno == EINTR) {
        ;
    }
}

void CHyprsnap::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lg(m_mtPosted);
        m_vPosted.emplace_back(std::move(fn));
    }
    wake();
}

void CHyprsnap::processWake() {
    uint64_t count = 0;
    if (read(m_iWakeFD, &count, sizeof(count)) < 0 && errno != EAGAIN)
        Debug::log(ERR, "Reading the wake fd failed: %s", strerror(errno));

    std::vector<std::function<void()>> posted;
    {
        std::lock_guard<std::mutex> lg(m_mtPosted);
        posted.swap(m_vPosted);
    }

    for (auto& fn : posted) {
        fn();
    }

    if (m_pScreenSource)
        m_pScreenSource->dispatchPending();

    takePreview();
}

void CHyprsnap::finish(int code) {
    m_iExitCode = code;
    m_bRunning  = false;
    wake();
}

void CHyprsnap::shutdown() {
    // fail pending captures first so the tick thread doesn't sit out its timeout
    if (m_pScreenSource)
        m_pScreenSource->shutdown();

    if (m_pEngine)
        m_pEngine->stop();

    // queued history writes still land, their replies are dropped with the posts below
    if (m_pPersistence)
        m_pPersistence->stop();

    {
        std::lock_guard<std::mutex> lg(m_mtPosted);
        m_vPosted.clear();
    }

    destroyOverlays();

    if (m_pHistory) {
        if (const auto RES = m_pHistory->flush(); !RES)
            Debug::log(ERR, "History: final flush failed: %s", RES.error().message.c_str());
    }

    m_pControl.reset();
    m_pPersistence.reset();
    m_pShortcut.reset();
    m_pEngine.reset();
    m_pScreenSource.reset();

    if (m_pWLDisplay) {
        m_vLayerSurfaces.clear();
        m_vMonitors.clear();
        m_pCompositor.reset();
        m_pRegistry.reset();
        m_pSHM.reset();
        m_pLayerShell.reset();
        m_pScreencopyMgr.reset();
        m_pXDGOutputMgr.reset();
        m_pCursorShapeMgr.reset();
        m_pCursorShapeDevice.reset();
        m_pGlobalShortcutsMgr.reset();
        m_pSeat.reset();
        m_pKeyboard.reset();
        m_pPointer.reset();
        m_pViewporter.reset();
        m_pFractionalMgr.reset();

        wl_display_disconnect(m_pWLDisplay);
        m_pWLDisplay = nullptr;
    }

    if (m_pXKBState)
        xkb_state_unref(m_pXKBState);
    if (m_pXKBKeymap)
        xkb_keymap_unref(m_pXKBKeymap);
    if (m_pXKBContext)
        xkb_context_unref(m_pXKBContext);
    m_pXKBState   = nullptr;
    m_pXKBKeymap  = nullptr;
    m_pXKBContext = nullptr;

    if (m_iWakeFD >= 0) {
        close(m_iWakeFD);
        m_iWakeFD = -1;
    }
}

SMonitor* CHyprsnap::monitorFromID(int id) {
    for (auto& m : m_vMonitors) {
        if ((int)m->wayland_name == id)
            return m.get();
    }

    return nullptr;
}

void CHyprsnap::onMonitorsChanged() {
    std::vector<SMonitorGeometry> layout;
    for (auto& m : m_vMonitors) {
        if (!m->ready)
            continue;

        const auto GEOMETRY = m->geometry();
        Debug::log(TRACE, "Monitor %s (%i): %.0fx%.0f px, logical %.0fx%.0f at %.0f, %.0f", GEOMETRY.name.c_str(), GEOMETRY.id, GEOMETRY.pixelSize.x, GEOMETRY.pixelSize.y,
                   GEOMETRY.logicalSize.x, GEOMETRY.logicalSize.y, GEOMETRY.position.x, GEOMETRY.position.y);
        layout.emplace_back(GEOMETRY);
    }

    std::lock_guard<std::mutex> lg(m_mtCursor);
    m_vLayout = std::move(layout);
}

std::optional<Vector2D> CHyprsnap::cursorPosition() {
    std::lock_guard<std::mutex> lg(m_mtCursor);
    return m_vCursorGlobal;
}

std::vector<SMonitorGeometry> CHyprsnap::monitorLayout() {
    std::lock_guard<std::mutex> lg(m_mtCursor);
    return m_vLayout;
}

void CHyprsnap::updateCursor() {
    std::optional<Vector2D> global;

    if (m_pLastSurface && m_bCoordsInitialized) {
        const auto GEOMETRY = m_pLastSurface->m_pMonitor->geometry();
        global              = GEOMETRY.position + m_vLastCoords + m_vNudgeBufPx / GEOMETRY.scale();
    }

    // leaving one overlay on the way into the next keeps the last known spot
    if (!global)
        return;

    std::lock_guard<std::mutex> lg(m_mtCursor);
    m_vCursorGlobal = global;
}

void CHyprsnap::armPick() {
    if (!m_pEngine->arm())
        Debug::log(LOG, "Already picking (%s)", pickStateName(m_pEngine->state()));
}

void CHyprsnap::confirmPick() {
    if (m_pEngine)
        m_pEngine->confirm();
}

void CHyprsnap::cancelPick() {
    if (m_pEngine)
        m_pEngine->cancel();
}

void CHyprsnap::handleHotkey() {
    m_pEngine->onHotkey();
}

void CHyprsnap::handleControl(const std::string& line, FControlReply reply) {
    const SControlContext CTX = {.engine = m_pEngine.get(), .history = m_pHistory.get(), .hotkeyLabel = m_pShortcut ? m_pShortcut->trigger() : m_sHotkeyLabel, .hotkeyRegistered = (bool)m_pShortcut};

    if (!NControl::writesHistory(line) || !m_pPersistence) {
        reply(NControl::reply(line, CTX));
        return;
    }

    // fsync and rename stay off the thread that handles pointer and keyboard input
    const bool QUEUED = m_pPersistence->push([this, line, CTX, reply]() {
        const auto REPLY = NControl::reply(line, CTX);
        post([reply, REPLY]() { reply(REPLY); });
    });

    if (!QUEUED)
        reply(NEvents::dump(NControl::errorReply(SPickError{.kind = PICK_ERROR_PERSISTENCE_WRITE_FAILED, .message = "shutting down"})));
}

void CHyprsnap::onPickArmed() {
    emitEvent(NEvents::pickModeStarted());
    post([this]() { createOverlays(); });
}

void CHyprsnap::onColorPicked(const SColorInfo& info) {
    if (m_pHistory) {
        if (const auto RES = m_pHistory->add(info); !RES) {
            Debug::log(ERR, "%s: %s", errorKindName(RES.error().kind), RES.error().message.c_str());
            if (m_bNotify)
                NNotify::sendError("Couldn't save the color history");
        }
    }

    const auto COL       = CColor::fromRGB(info.rgb);
    const auto FORMATTED = formatColor(COL, m_bSelectedOutputMode, m_bUseLowerCase);

    printColor(info);

    if (m_bAutoCopy)
        NClipboard::copy(FORMATTED);
    if (m_bNotify)
        NNotify::send(info.hex, FORMATTED);

    emitEvent(NEvents::colorPicked(info));
    emitEvent(NEvents::pickModeStopped(std::nullopt));

    post([this]() {
        destroyOverlays();
        if (m_bOneShot)
            finish(0);
    });
}

void CHyprsnap::onPickCancelled(const std::optional<SPickError>& error) {
    if (error) {
        Debug::log(ERR, "Pick failed, %s: %s", errorKindName(error->kind), error->message.c_str());
        if (m_bNotify)
            NNotify::sendError(std::format("Couldn't read the screen: {}", error->message));
    } else
        Debug::log(LOG, "Pick cancelled");

    emitEvent(NEvents::pickModeStopped(error));

    post([this, FAILED = error.has_value()]() {
        destroyOverlays();
        if (m_bOneShot)
            finish(FAILED ? 1 : 2);
    });
}

void CHyprsnap::emitEvent(const std::string& line) {
    if (m_bJsonEvents)
        Debug::log(NONE, "%s", line.c_str());
}

void CHyprsnap::printColor(const SColorInfo& info) {
    // json consumers get the color-picked event instead
    if (m_bJsonEvents)
        return;

    const auto    COL       = CColor::fromRGB(info.rgb);
    const auto    FORMATTED = formatColor(COL, m_bSelectedOutputMode, m_bUseLowerCase);
    const uint8_t FG        = COL.luminance() > 0.17913 ? 0 : 255;

    if (m_bFancyOutput)
        Debug::log(NONE, "\033[38;2;%i;%i;%i;48;2;%i;%i;%im%s\033[0m", FG, FG, FG, COL.r, COL.g, COL.b, FORMATTED.c_str());
    else
        Debug::log(NONE, "%s", FORMATTED.c_str());
}

void CHyprsnap::createOverlays() {
    // the pick may already be over by the time we get here
    const auto STATE = m_pEngine->state();
    if (STATE != PICK_ARMED && STATE != PICK_SAMPLING)
        return;

    destroyOverlays();

    m_bCoordsInitialized = false;
    m_vNudgeBufPx        = {0, 0};
    m_iPreviewRadius     = m_pEngine->previewRadius();

    for (auto& m : m_vMonitors) {
        if (!m->ready)
            continue;

        m_vLayerSurfaces.emplace_back(std::make_unique<CLayerSurface>(m.get()));
        m->pLS = m_vLayerSurfaces.back().get();
    }

    Debug::log(LOG, "Pick mode: overlays up on %zu monitor(s)", m_vLayerSurfaces.size());
}

void CHyprsnap::destroyOverlays() {
    for (auto& m : m_vMonitors) {
        m->pLS = nullptr;
    }

    m_vLayerSurfaces.clear();
    m_pLastSurface       = nullptr;
    m_bCoordsInitialized = false;

    if (m_pPreviewSurface) {
        cairo_surface_destroy(m_pPreviewSurface);
        m_pPreviewSurface = nullptr;
    }

    std::lock_guard<std::mutex> lg(m_mtCursor);
    m_vCursorGlobal.reset();
}

void CHyprsnap::takePreview() {
    if (!m_pEngine)
        return;

    auto frame = m_pEngine->previews().take();
    if (!frame)
        return;

    // a frame published just before the pick ended
    if (m_vLayerSurfaces.empty())
        return;

    std::pair<const std::vector<uint8_t>*, size_t> reader = {&frame->image, 0};

    const auto DECODED = cairo_image_surface_create_from_png_stream(readPNGChunk, &reader);
    if (cairo_surface_status(DECODED) != CAIRO_STATUS_SUCCESS) {
        Debug::log(ERR, "Couldn't decode a preview frame: %s", cairo_status_to_string(cairo_surface_status(DECODED)));
        cairo_surface_destroy(DECODED);
        return;
    }

    if (m_pPreviewSurface)
        cairo_surface_destroy(m_pPreviewSurface);

    m_pPreviewSurface = DECODED;
    m_sPreviewCenter  = frame->center;

    if (m_bJsonEvents) {
        const auto POS = CCoordinateMapper::toGlobalPixel(frame->center.source, monitorLayout());
        emitEvent(NEvents::zoomPreview(*frame, (int)POS.x, (int)POS.y));
    }

    if (m_pLastSurface)
        m_pLastSurface->markDirty();
}

void CHyprsnap::recheckACK() {
    for (auto& ls : m_vLayerSurfaces) {
        if ((ls->wantsACK || ls->wantsReload) && ls->configured) {
            if (ls->wantsACK)
                ls->pLayerSurface->sendAckConfigure(ls->ACKSerial);
            ls->wantsACK    = false;
            ls->wantsReload = false;

            const auto BUFFERSIZE = (ls->logicalSize * ls->bufferScale()).round();

            if (BUFFERSIZE.x <= 0 || BUFFERSIZE.y <= 0)
                continue;

            if (!ls->buffers[0] || ls->buffers[0]->pixelSize != BUFFERSIZE) {
                Debug::log(TRACE, "making new buffers: size changed to %.0fx%.0f", BUFFERSIZE.x, BUFFERSIZE.y);
                ls->buffers[0] = makeShared<SPoolBuffer>(BUFFERSIZE, WL_SHM_FORMAT_ARGB8888, BUFFERSIZE.x * 4);
                ls->buffers[1] = makeShared<SPoolBuffer>(BUFFERSIZE, WL_SHM_FORMAT_ARGB8888, BUFFERSIZE.x * 4);
            }

            // first attach maps the overlay, frame callbacks take over after that
            if (!ls->rendered)
                renderSurface(ls.get());
        }
    }

    markDirty();
}

void CHyprsnap::markDirty() {
    for (auto& ls : m_vLayerSurfaces) {
        if (ls->frameCallback)
            continue;

        ls->markDirty();
    }
}

SP<SPoolBuffer> CHyprsnap::getBufferForLS(CLayerSurface* pLS) {
    SP<SPoolBuffer> returns = nullptr;

    for (auto i = 0; i < 2; ++i) {
        if (!pLS->buffers[i] || pLS->buffers[i]->busy || !pLS->buffers[i]->good())
            continue;

        returns = pLS->buffers[i];
    }

    return returns;
}

bool CHyprsnap::setCloexec(const int& FD) {
    long flags = fcntl(FD, F_GETFD);
    if (flags == -1) {
        return false;
    }

    if (fcntl(FD, F_SETFD, flags | FD_CLOEXEC) == -1) {
        return false;
    }

    return true;
}

int CHyprsnap::createPoolFile(size_t size, std::string& name) {
    const auto XDGRUNTIMEDIR = getenv("XDG_RUNTIME_DIR");
    if (!XDGRUNTIMEDIR) {
        Debug::log(ERR, "XDG_RUNTIME_DIR not set!");
        return -1;
    }

    name = std::string(XDGRUNTIMEDIR) + "/.hyprsnap_XXXXXX";

    const auto FD = mkstemp((char*)name.c_str());
    if (FD < 0) {
        Debug::log(ERR, "createPoolFile: fd < 0");
        name = "";
        return -1;
    }

    if (!setCloexec(FD)) {
        close(FD);
        unlink(name.c_str());
        name = "";
        Debug::log(ERR, "createPoolFile: !setCloexec");
        return -1;
    }

    if (ftruncate(FD, size) < 0) {
        close(FD);
        unlink(name.c_str());
        name = "";
        Debug::log(ERR, "createPoolFile: ftruncate < 0");
        return -1;
    }

    return FD;
}

void CHyprsnap::renderSurface(CLayerSurface* pSurface) {
    const auto PBUFFER = getBufferForLS(pSurface);

    if (!PBUFFER) {
        // both buffers still with the compositor, the frame callback retries
        pSurface->dirty = true;
        return;
    }

    PBUFFER->surface =
        cairo_image_surface_create_for_data((unsigned char*)PBUFFER->data, CAIRO_FORMAT_ARGB32, PBUFFER->pixelSize.x, PBUFFER->pixelSize.y, PBUFFER->pixelSize.x * 4);

    PBUFFER->cairo = cairo_create(PBUFFER->surface);

    const auto PCAIRO = PBUFFER->cairo;

    cairo_save(PCAIRO);
    cairo_set_operator(PCAIRO, CAIRO_OPERATOR_SOURCE);
    cairo_set_source_rgba(PCAIRO, 0, 0, 0, 0);
    cairo_rectangle(PCAIRO, 0, 0, PBUFFER->pixelSize.x, PBUFFER->pixelSize.y);
    cairo_fill(PCAIRO);
    cairo_restore(PCAIRO);

    if (pSurface == m_pLastSurface && m_bCoordsInitialized && m_pPreviewSurface) {
        // we draw the preview like this, off to the side of the cursor
        //
        //   x
        //      +-----------+
        //      |  zoomed   |
        //      |   block   |
        //      +-----------+
        //      [#] #RRGGBB
        //
        // and flip it to the other side near the output edges.

        const auto     GEOMETRY = pSurface->m_pMonitor->geometry();
        const Vector2D CURSOR   = m_vLastCoords + m_vNudgeBufPx / GEOMETRY.scale();

        const double   IMGW  = cairo_image_surface_get_width(m_pPreviewSurface);
        const double   IMGH  = cairo_image_surface_get_height(m_pPreviewSurface);
        const double   BOXW  = IMGW + PREVIEW_PADDING * 2;
        const double   BOXH  = IMGH + PREVIEW_PADDING * 3 + PREVIEW_LABEL_H;
        const double   GAPX  = PREVIEW_CURSOR_GAP + m_iPreviewRadius / GEOMETRY.scale().x;
        const double   GAPY  = PREVIEW_CURSOR_GAP + m_iPreviewRadius / GEOMETRY.scale().y;
        const double   ONEPX = 1.0 / pSurface->bufferScale();

        double         x = CURSOR.x + GAPX;
        double         y = CURSOR.y + GAPY;
        if (x + BOXW > pSurface->logicalSize.x)
            x = CURSOR.x - GAPX - BOXW;
        if (y + BOXH > pSurface->logicalSize.y)
            y = CURSOR.y - GAPY - BOXH;
        x = std::max(0.0, x);
        y = std::max(0.0, y);

        cairo_save(PCAIRO);
        cairo_scale(PCAIRO, pSurface->bufferScale(), pSurface->bufferScale());

        // shadow, then the box
        cairo_set_source_rgba(PCAIRO, 0.0, 0.0, 0.0, RING_SHADOW_ALPHA);
        cairo_set_line_width(PCAIRO, RING_SHADOW_PX * ONEPX);
        roundedRect(PCAIRO, x - ONEPX, y - ONEPX, BOXW + 2 * ONEPX, BOXH + 2 * ONEPX, PREVIEW_CORNER);
        cairo_stroke(PCAIRO);

        cairo_set_source_rgba(PCAIRO, 0.0, 0.0, 0.0, 0.75);
        roundedRect(PCAIRO, x, y, BOXW, BOXH, PREVIEW_CORNER);
        cairo_fill(PCAIRO);

        // the frame already is pixel exact, don't let scaling smear it
        const double IMGX = x + PREVIEW_PADDING;
        const double IMGY = y + PREVIEW_PADDING;
        cairo_save(PCAIRO);
        cairo_rectangle(PCAIRO, IMGX, IMGY, IMGW, IMGH);
        cairo_clip(PCAIRO);
        cairo_set_source_surface(PCAIRO, m_pPreviewSurface, IMGX, IMGY);
        cairo_pattern_set_filter(cairo_get_source(PCAIRO), CAIRO_FILTER_NEAREST);
        cairo_paint(PCAIRO);
        cairo_restore(PCAIRO);

        cairo_set_source_rgba(PCAIRO, 1.0, 1.0, 1.0, 1.0);
        cairo_set_line_width(PCAIRO, RING_BORDER_PX * ONEPX);
        cairo_rectangle(PCAIRO, IMGX, IMGY, IMGW, IMGH);
        cairo_stroke(PCAIRO);

        // swatch and the value the clipboard would get
        const auto  COL    = CColor::fromRGB(m_sPreviewCenter.rgb);
        const auto  LABEL  = formatColor(COL, m_bSelectedOutputMode, m_bUseLowerCase);
        const auto  LABELY = IMGY + IMGH + PREVIEW_PADDING;

        cairo_set_source_rgba(PCAIRO, COL.r / 255.0, COL.g / 255.0, COL.b / 255.0, 1.0);
        roundedRect(PCAIRO, IMGX, LABELY, PREVIEW_LABEL_H, PREVIEW_LABEL_H, 4);
        cairo_fill_preserve(PCAIRO);
        cairo_set_source_rgba(PCAIRO, 1.0, 1.0, 1.0, 1.0);
        cairo_set_line_width(PCAIRO, ONEPX);
        cairo_stroke(PCAIRO);

        cairo_rectangle(PCAIRO, IMGX, LABELY, IMGW, PREVIEW_LABEL_H);
        cairo_clip(PCAIRO);
        cairo_select_font_face(PCAIRO, "monospace", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
        cairo_set_font_size(PCAIRO, 16);
        cairo_move_to(PCAIRO, IMGX + PREVIEW_LABEL_H + PREVIEW_PADDING, LABELY + PREVIEW_LABEL_H - 8);
        cairo_show_text(PCAIRO, LABEL.c_str());

        cairo_restore(PCAIRO);
    }

    cairo_surface_flush(PBUFFER->surface);

    pSurface->sendFrame(PBUFFER);
    cairo_destroy(PCAIRO);
    cairo_surface_destroy(PBUFFER->surface);

    PBUFFER->cairo   = nullptr;
    PBUFFER->surface = nullptr;
}

void CHyprsnap::initKeyboard() {
    m_pKeyboard->setKeymap([this](CCWlKeyboard* r, wl_keyboard_keymap_format format, int32_t fd, uint32_t size) {
        if (!m_pXKBContext) {
            close(fd);
            return;
        }

        if (format != WL_KEYBOARD_KEYMAP_FORMAT_XKB_V1) {
            Debug::log(ERR, "Could not recognise keymap format");
            close(fd);
            return;
        }

        const char* buf = (const char*)mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
        if (buf == MAP_FAILED) {
            Debug::log(ERR, "Failed to mmap xkb keymap: %d", errno);
            close(fd);
            return;
        }

        if (m_pXKBState)
            xkb_state_unref(m_pXKBState);
        if (m_pXKBKeymap)
            xkb_keymap_unref(m_pXKBKeymap);
        m_pXKBState = nullptr;

        m_pXKBKeymap = xkb_keymap_new_from_buffer(m_pXKBContext, buf, size - 1, XKB_KEYMAP_FORMAT_TEXT_V1, XKB_KEYMAP_COMPILE_NO_FLAGS);

        munmap((void*)buf, size);
        close(fd);

        if (!m_pXKBKeymap) {
            Debug::log(ERR, "Failed to compile xkb keymap");
            return;
        }

        m_pXKBState = xkb_state_new(m_pXKBKeymap);
        if (!m_pXKBState)
            Debug::log(ERR, "Failed to create xkb state");
    });

    m_pKeyboard->setModifiers([this](CCWlKeyboard* r, uint32_t serial, uint32_t mods_depressed, uint32_t mods_latched, uint32_t mods_locked, uint32_t group) {
        if (m_pXKBState)
            xkb_state_update_mask(m_pXKBState, mods_depressed, mods_latched, mods_locked, 0, 0, group);
    });

    m_pKeyboard->setKey([this](CCWlKeyboard* r, uint32_t serial, uint32_t time, uint32_t key, uint32_t state) {
        if (state != WL_KEYBOARD_KEY_STATE_PRESSED)
            return;

        if (!m_pXKBState) {
            if (key == KEY_ESC)
                cancelPick();
            else if (key == KEY_ENTER || key == KEY_KPENTER)
                confirmPick();
            return;
        }

        const xkb_keysym_t SYM = xkb_state_key_get_one_sym(m_pXKBState, key + 8);

        if (SYM == XKB_KEY_Escape) {
            cancelPick();
            return;
        }

        if (SYM == XKB_KEY_Return || SYM == XKB_KEY_KP_Enter) {
            confirmPick();
            return;
        }

        if (!m_bCoordsInitialized || !m_pLastSurface)
            return;

        const double STEP   = xkb_state_mod_name_is_active(m_pXKBState, XKB_MOD_NAME_SHIFT, XKB_STATE_MODS_EFFECTIVE) > 0 ? NUDGE_STEP_BIG : NUDGE_STEP;
        bool         nudged = false;
        switch (SYM) {
            case XKB_KEY_Left: m_vNudgeBufPx.x -= STEP; nudged = true; break;
            case XKB_KEY_Right: m_vNudgeBufPx.x += STEP; nudged = true; break;
            case XKB_KEY_Up: m_vNudgeBufPx.y -= STEP; nudged = true; break;
            case XKB_KEY_Down: m_vNudgeBufPx.y += STEP; nudged = true; break;
            default: break;
        }

        if (nudged) {
            updateCursor();
            m_pLastSurface->markDirty();
        }
    });
}

void CHyprsnap::initMouse() {
    m_pPointer->setEnter([this](CCWlPointer* r, uint32_t serial, wl_proxy* surface, wl_fixed_t surface_x, wl_fixed_t surface_y) {
        auto x = wl_fixed_to_double(surface_x);
        auto y = wl_fixed_to_double(surface_y);

        m_vLastCoords        = {x, y};
        m_bCoordsInitialized = true;
        m_vNudgeBufPx        = {0, 0};

        for (auto& ls : m_vLayerSurfaces) {
            if (ls->pSurface->resource() == surface) {
                m_pLastSurface = ls.get();
                break;
            }
        }

        if (m_pCursorShapeDevice)
            m_pCursorShapeDevice->sendSetShape(serial, WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_CROSSHAIR);

        updateCursor();
        markDirty();
    });
    m_pPointer->setLeave([this](CCWlPointer* r, uint32_t timeMs, wl_proxy* surface) {
        for (auto& ls : m_vLayerSurfaces) {
            if (ls->pSurface->resource() == surface) {
                if (m_pLastSurface == ls.get())
                    m_pLastSurface = nullptr;
                // drop the preview from the output we left
                ls->markDirty();
                break;
            }
        }
    });
    m_pPointer->setMotion([this](CCWlPointer* r, uint32_t timeMs, wl_fixed_t surface_x, wl_fixed_t surface_y) {
        auto x = wl_fixed_to_double(surface_x);
        auto y = wl_fixed_to_double(surface_y);

        m_vLastCoords = {x, y};
        // reset nudge on mouse movement
        m_vNudgeBufPx = {0, 0};

        // move the preview out of the way before the next capture request goes out
        if (m_pLastSurface)
            renderSurface(m_pLastSurface);

        updateCursor();
    });
    m_pPointer->setButton([this](CCWlPointer* r, uint32_t serial, uint32_t time, uint32_t button, uint32_t button_state) {
        // Only act on press to avoid duplicate actions on release
        if (button_state != WL_POINTER_BUTTON_STATE_PRESSED)
            return;

        if (button == BTN_LEFT)
            confirmPick();
        else if (button == BTN_RIGHT)
            cancelPick();
    });
}
