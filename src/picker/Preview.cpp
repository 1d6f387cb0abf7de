#include "Preview.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <cairo/cairo.h>
#include <cstring>
#include <format>

static cairo_status_t writePNGChunk(void* closure, const unsigned char* data, unsigned int length) {
    auto* out = (std::vector<uint8_t>*)closure;
    out->insert(out->end(), data, data + length);
    return CAIRO_STATUS_SUCCESS;
}

CPreviewRenderer::CPreviewRenderer(CSharedPointer<CScreenSampler> sampler, int blockSize, int magnification) : m_pSampler(sampler) {
    if (blockSize % 2 == 0)
        blockSize++;

    m_iBlockSize     = std::clamp(blockSize, PREVIEW_BLOCK_MIN, PREVIEW_BLOCK_MAX);
    m_iMagnification = std::clamp(magnification, PREVIEW_MAG_MIN, PREVIEW_MAG_MAX);
}

int CPreviewRenderer::blockSize() const {
    return m_iBlockSize;
}

int CPreviewRenderer::radius() const {
    return m_iBlockSize / 2;
}

int CPreviewRenderer::magnification() const {
    return m_iMagnification;
}

CPickResult<SPreviewFrame> CPreviewRenderer::render(const SScreenPoint& center) {
    if (!m_pSampler)
        return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "no sampler");

    const auto BLOCK = m_pSampler->sampleBlock(center, radius());

    if (!BLOCK)
        return std::unexpected(BLOCK.error());

    return renderBlock(*BLOCK);
}

CPickResult<SPreviewFrame> CPreviewRenderer::renderBlock(const SPixelBlock& block) const {
    if (block.width <= 0 || block.height <= 0 || block.width % 2 == 0 || block.height % 2 == 0 || block.pixels.size() < (size_t)block.width * block.height)
        return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("bad preview block {}x{}", block.width, block.height));

    const int MAG    = m_iMagnification;
    const int WIDTH  = block.width * MAG;
    const int HEIGHT = block.height * MAG;

    // RGB24 so whatever is in the alpha byte never gets premultiplied in
    const auto SOURCE = cairo_image_surface_create(CAIRO_FORMAT_RGB24, block.width, block.height);
    const auto TARGET = cairo_image_surface_create(CAIRO_FORMAT_RGB24, WIDTH, HEIGHT);

    if (cairo_surface_status(SOURCE) != CAIRO_STATUS_SUCCESS || cairo_surface_status(TARGET) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(SOURCE);
        cairo_surface_destroy(TARGET);
        return pickError(PICK_ERROR_ENCODE_FAILED, "couldn't allocate preview surfaces");
    }

    cairo_surface_flush(SOURCE);
    unsigned char* data   = cairo_image_surface_get_data(SOURCE);
    const int      STRIDE = cairo_image_surface_get_stride(SOURCE);
    for (int y = 0; y < block.height; ++y) {
        memcpy(data + (ptrdiff_t)y * STRIDE, block.pixels.data() + (size_t)y * block.width, (size_t)block.width * 4);
    }
    cairo_surface_mark_dirty(SOURCE);

    const auto PCAIRO = cairo_create(TARGET);

    // every source pixel becomes an exact MAGxMAG square, no filtering
    const auto PATTERN = cairo_pattern_create_for_surface(SOURCE);
    cairo_pattern_set_filter(PATTERN, CAIRO_FILTER_NEAREST);
    cairo_matrix_t matrix;
    cairo_matrix_init_scale(&matrix, 1.0 / MAG, 1.0 / MAG);
    cairo_pattern_set_matrix(PATTERN, &matrix);
    cairo_set_source(PCAIRO, PATTERN);
    cairo_paint(PCAIRO);
    cairo_pattern_destroy(PATTERN);

    // faint grid on the pixel boundaries
    cairo_save(PCAIRO);
    cairo_set_antialias(PCAIRO, CAIRO_ANTIALIAS_NONE);
    cairo_set_source_rgba(PCAIRO, 1.0, 1.0, 1.0, PREVIEW_GRID_ALPHA);
    cairo_set_line_width(PCAIRO, 1.0);
    for (int i = 1; i < block.width; ++i) {
        cairo_move_to(PCAIRO, i * MAG + 0.5, 0);
        cairo_line_to(PCAIRO, i * MAG + 0.5, HEIGHT);
    }
    for (int i = 1; i < block.height; ++i) {
        cairo_move_to(PCAIRO, 0, i * MAG + 0.5);
        cairo_line_to(PCAIRO, WIDTH, i * MAG + 0.5);
    }
    cairo_stroke(PCAIRO);
    cairo_restore(PCAIRO);

    // center marker, white outside the cell and black on its inner edge so it
    // reads on any color. The middle of the cell is left untouched.
    {
        const double LEFT = (block.width / 2) * MAG;
        const double TOP  = (block.height / 2) * MAG;

        cairo_save(PCAIRO);
        cairo_set_antialias(PCAIRO, CAIRO_ANTIALIAS_NONE);
        cairo_set_line_width(PCAIRO, 1.0);

        cairo_set_source_rgba(PCAIRO, 1.0, 1.0, 1.0, 1.0);
        cairo_rectangle(PCAIRO, LEFT - 0.5, TOP - 0.5, MAG + 1, MAG + 1);
        cairo_stroke(PCAIRO);

        cairo_set_source_rgba(PCAIRO, 0.0, 0.0, 0.0, 1.0);
        cairo_rectangle(PCAIRO, LEFT + 0.5, TOP + 0.5, MAG - 1, MAG - 1);
        cairo_stroke(PCAIRO);

        cairo_restore(PCAIRO);
    }

    cairo_surface_flush(TARGET);
    cairo_destroy(PCAIRO);

    SPreviewFrame frame = {.width = WIDTH, .height = HEIGHT, .center = CScreenSampler::centerOf(block)};

    const auto    STATUS = cairo_surface_write_to_png_stream(TARGET, writePNGChunk, &frame.image);

    cairo_surface_destroy(TARGET);
    cairo_surface_destroy(SOURCE);

    if (STATUS != CAIRO_STATUS_SUCCESS)
        return pickError(PICK_ERROR_ENCODE_FAILED, std::format("png encode failed: {}", cairo_status_to_string(STATUS)));

    return frame;
}
