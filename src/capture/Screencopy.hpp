#pragma once

#include "../defines.hpp"
#include "../helpers/PoolBuffer.hpp"
#include "../picker/Sampler.hpp"
#include "CaptureQueue.hpp"

#include <memory>
#include <vector>

// IScreenSource over zwlr_screencopy_v1. capture() may be called from any
// thread; the protocol work happens on the Wayland thread, which is poked
// through the wake fd and calls dispatchPending().
class CScreencopySource : public IScreenSource {
  public:
    CScreencopySource(SP<CCZwlrScreencopyManagerV1> manager, std::function<void()> wake);
    virtual ~CScreencopySource();

    virtual CPickResult<SPixelBlock> capture(int monitor, const CBox& region);

    // Wayland thread only
    void                             dispatchPending();
    // fails everything queued or in flight, later captures fail immediately
    void                             shutdown();

  private:
    struct SCaptureJob {
        std::shared_ptr<SCaptureRequest>      request;

        SP<CCZwlrScreencopyFrameV1>           frame;
        SP<SPoolBuffer>                       buffer;
        uint32_t                              flags = 0;
        Vector2D                              origin; // device pixel of the buffer's top-left
        bool                                  done  = false;
    };

    void                                      start(std::shared_ptr<SCaptureRequest> request);
    void                                      finishJob(CPickResult<SPixelBlock> result);
    CPickResult<SPixelBlock>                  readBuffer(const SCaptureJob& job);

    SP<CCZwlrScreencopyManagerV1>             m_pManager;
    std::function<void()>                     m_wake;

    CCaptureQueue                             m_captures;

    // Wayland thread only
    std::unique_ptr<SCaptureJob>              m_pInFlight;
    // finished frames are torn down on the next dispatch, not inside their own events
    std::vector<std::unique_ptr<SCaptureJob>> m_vFinished;
};
