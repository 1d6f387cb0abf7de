#pragma once

#include "defines.hpp"
#include "capture/Screencopy.hpp"
#include "helpers/LayerSurface.hpp"
#include "helpers/PoolBuffer.hpp"
#include "helpers/WorkQueue.hpp"
#include "history/History.hpp"
#include "hotkey/GlobalShortcut.hpp"
#include "ipc/Control.hpp"
#include "picker/PickMode.hpp"

#include <atomic>
#include <functional>
#include <optional>

constexpr const char* HOTKEY_LABEL_DEFAULT = "Super+Shift+C";

class CHyprsnap : public ICursorSource, public IPickerSink {
  public:
    // returns the exit code
    int                                         init();

    SP<CCWlCompositor>                          m_pCompositor;
    SP<CCWlRegistry>                            m_pRegistry;
    SP<CCWlShm>                                 m_pSHM;
    SP<CCZwlrLayerShellV1>                      m_pLayerShell;
    SP<CCZwlrScreencopyManagerV1>               m_pScreencopyMgr;
    SP<CCZxdgOutputManagerV1>                   m_pXDGOutputMgr;
    SP<CCWpCursorShapeManagerV1>                m_pCursorShapeMgr;
    SP<CCWpCursorShapeDeviceV1>                 m_pCursorShapeDevice;
    SP<CCHyprlandGlobalShortcutsManagerV1>      m_pGlobalShortcutsMgr;
    SP<CCWlSeat>                                m_pSeat;
    SP<CCWlKeyboard>                            m_pKeyboard;
    SP<CCWlPointer>                             m_pPointer;
    SP<CCWpFractionalScaleManagerV1>            m_pFractionalMgr;
    SP<CCWpViewporter>                          m_pViewporter;
    wl_display*                                 m_pWLDisplay = nullptr;

    xkb_context*                                m_pXKBContext = nullptr;
    xkb_keymap*                                 m_pXKBKeymap  = nullptr;
    xkb_state*                                  m_pXKBState   = nullptr;

    // set from the command line before init()
    eOutputMode                                 m_bSelectedOutputMode = OUTPUT_HEX;
    bool                                        m_bFancyOutput        = true;
    bool                                        m_bAutoCopy           = true;
    bool                                        m_bNotify             = false;
    bool                                        m_bJsonEvents         = false;
    bool                                        m_bUseLowerCase       = false;
    bool                                        m_bOneShot            = false;
    bool                                        m_bNoFractional       = false;
    std::string                                 m_sHotkeyLabel        = HOTKEY_LABEL_DEFAULT;
    std::string                                 m_sHistoryPath        = "";
    std::string                                 m_sSocketPath         = "";
    SPickModeConfig                             m_sPickConfig;

    std::atomic<bool>                           m_bRunning = true;
    int                                         m_iExitCode = 0;

    std::vector<std::unique_ptr<SMonitor>>      m_vMonitors;
    std::vector<std::unique_ptr<CLayerSurface>> m_vLayerSurfaces;

    CLayerSurface*                              m_pLastSurface = nullptr;

    // surface local, logical
    Vector2D                                    m_vLastCoords;
    bool                                        m_bCoordsInitialized = false;

    // keyboard nudge in device pixels of the monitor under the cursor
    Vector2D                                    m_vNudgeBufPx = {0, 0};

    // ICursorSource, read from the tick thread
    virtual std::optional<Vector2D>             cursorPosition();
    virtual std::vector<SMonitorGeometry>       monitorLayout();

    // IPickerSink
    virtual void                                onPickArmed();
    virtual void                                onColorPicked(const SColorInfo& info);
    virtual void                                onPickCancelled(const std::optional<SPickError>& error);

    void                                        renderSurface(CLayerSurface*);

    int                                         createPoolFile(size_t, std::string&);
    bool                                        setCloexec(const int&);
    void                                        recheckACK();
    void                                        initKeyboard();
    void                                        initMouse();

    SP<SPoolBuffer>                             getBufferForLS(CLayerSurface*);

    void                                        markDirty();
    void                                        onMonitorsChanged();
    SMonitor*                                   monitorFromID(int id);

    void                                        armPick();
    void                                        confirmPick();
    void                                        cancelPick();

    // safe from any thread and from signal handlers
    void                                        wake();
    // runs fn on the Wayland thread
    void                                        post(std::function<void()> fn);

    void                                        finish(int code = 0);

  private:
    void                                        bindGlobals();
    void                                        eventLoop();
    void                                        processWake();
    void                                        takePreview();
    void                                        createOverlays();
    void                                        destroyOverlays();
    void                                        updateCursor();
    void                                        handleHotkey();
    void                                        handleControl(const std::string& line, FControlReply reply);
    void                                        printColor(const SColorInfo& info);
    void                                        emitEvent(const std::string& line);
    void                                        shutdown();

    std::unique_ptr<CPickModeEngine>            m_pEngine;
    SP<CScreencopySource>                       m_pScreenSource;
    std::unique_ptr<CHistoryStore>              m_pHistory;
    SP<CGlobalShortcut>                         m_pShortcut;
    std::unique_ptr<CControlServer>             m_pControl;
    // history writes asked for over the socket
    std::unique_ptr<CWorkQueue>                 m_pPersistence;
    bool                                        m_bHotkeyFailureLogged = false;

    int                                         m_iWakeFD = -1;
    std::mutex                                  m_mtPosted;
    std::vector<std::function<void()>>          m_vPosted;

    // shared with the tick thread
    std::mutex                                  m_mtCursor;
    std::optional<Vector2D>                     m_vCursorGlobal;
    std::vector<SMonitorGeometry>               m_vLayout;

    // the latest preview, decoded for drawing
    cairo_surface_t*                            m_pPreviewSurface = nullptr;
    SColorSample                                m_sPreviewCenter;
    int                                         m_iPreviewRadius  = PREVIEW_BLOCK_DEFAULT / 2;
};

inline std::unique_ptr<CHyprsnap> g_pHyprsnap;
