#pragma once

namespace core::model {
    /**
     * @brief Calibration and material flags forwarded with the start command
     */
    struct PrintOptions {
        bool bedLevelling = true;
        bool flowCali = false;
        bool vibrationCali = true;
        bool layerInspect = false;
        bool timelapse = false;
        bool useAms = true;
    };
}
