#include "LayerSurface.hpp"
#include "../hyprsnap.hpp"

CLayerSurface::CLayerSurface(SMonitor* pMonitor) {
    m_pMonitor = pMonitor;

    pSurface = makeShared<CCWlSurface>(g_pHyprsnap->m_pCompositor->sendCreateSurface());

    if (!pSurface) {
        Debug::log(CRIT, "The compositor did not allow hyprsnap a surface!");
        g_pHyprsnap->finish(1);
        return;
    }

    if (!g_pHyprsnap->m_bNoFractional) {
        pFractionalScale = makeShared<CCWpFractionalScaleV1>(g_pHyprsnap->m_pFractionalMgr->sendGetFractionalScale(pSurface->resource()));

        pFractionalScale->setPreferredScale([this](CCWpFractionalScaleV1* r, uint32_t scale120) {
            const double SCALE = scale120 / 120.0;
            if (SCALE == fractionalScale)
                return;

            Debug::log(TRACE, "Overlay on %s: fractional scale %.3f", m_pMonitor->name.c_str(), SCALE);
            fractionalScale = SCALE;
            wantsReload     = true;
            g_pHyprsnap->recheckACK();
        });

        pViewport = makeShared<CCWpViewport>(g_pHyprsnap->m_pViewporter->sendGetViewport(pSurface->resource()));
    }

    pLayerSurface = makeShared<CCZwlrLayerSurfaceV1>(
        g_pHyprsnap->m_pLayerShell->sendGetLayerSurface(pSurface->resource(), pMonitor->output->resource(), ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY, "hyprsnap"));

    if (!pLayerSurface) {
        Debug::log(CRIT, "The compositor did not allow hyprsnap a layersurface!");
        g_pHyprsnap->finish(1);
        return;
    }

    pLayerSurface->setConfigure([this](CCZwlrLayerSurfaceV1* r, uint32_t serial, uint32_t width, uint32_t height) {
        logicalSize = {(double)width, (double)height};
        wantsACK    = true;
        ACKSerial   = serial;
        configured  = true;
        g_pHyprsnap->recheckACK();
    });

    pLayerSurface->setClosed([this](CCZwlrLayerSurfaceV1* r) {
        Debug::log(WARN, "Overlay on %s closed by the compositor, cancelling the pick", m_pMonitor->name.c_str());
        g_pHyprsnap->cancelPick();
    });

    pLayerSurface->sendSetAnchor((zwlrLayerSurfaceV1Anchor)(ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP | ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM | ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT |
                                                            ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT));
    pLayerSurface->sendSetExclusiveZone(-1);
    pLayerSurface->sendSetKeyboardInteractivity(ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_EXCLUSIVE);
    pSurface->sendCommit();

    wl_display_flush(g_pHyprsnap->m_pWLDisplay);
}

CLayerSurface::~CLayerSurface() {
    frameCallback.reset();
    pLayerSurface.reset();
    pFractionalScale.reset();
    pViewport.reset();
    pSurface.reset();

    if (g_pHyprsnap->m_pWLDisplay)
        wl_display_flush(g_pHyprsnap->m_pWLDisplay);
}

double CLayerSurface::bufferScale() const {
    if (g_pHyprsnap->m_bNoFractional)
        return std::max(1, m_pMonitor->scale);
    return fractionalScale;
}

void CLayerSurface::markDirty() {
    dirty = true;

    if (frameCallback || !configured)
        return;

    frameCallback = makeShared<CCWlCallback>(pSurface->sendFrame());
    frameCallback->setDone([this](CCWlCallback* r, uint32_t when) {
        frameCallback.reset();

        if (dirty || !rendered)
            g_pHyprsnap->renderSurface(this);
    });

    pSurface->sendCommit();
}

void CLayerSurface::sendFrame(SP<SPoolBuffer> buffer) {
    buffer->busy = true;

    pSurface->sendAttach(buffer->buffer.get(), 0, 0);

    if (pViewport)
        pViewport->sendSetDestination(logicalSize.x, logicalSize.y);
    else
        pSurface->sendSetBufferScale(std::max(1, m_pMonitor->scale));

    pSurface->sendDamageBuffer(0, 0, 0xFFFF, 0xFFFF);
    pSurface->sendCommit();

    dirty    = false;
    rendered = true;
}
