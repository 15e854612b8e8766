#include "ocr/ocr_engine.h"
#include "common/logger.hpp"

#ifdef PICMOD_WITH_DXRT
#include "ocr/dx_ocr_engine.h"
#endif

namespace picmod {

std::unique_ptr<OcrEngine> CreateOcrEngine(const OcrConfig& config) {
#ifdef PICMOD_WITH_DXRT
    return std::make_unique<DxOcrEngine>(config);
#else
    (void)config;
    LOG_WARN("Built without the DEEPX runtime, OCR is unavailable");
    return nullptr;
#endif
}

} // namespace picmod
