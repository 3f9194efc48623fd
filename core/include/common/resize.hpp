#pragma once

#include <opencv2/imgproc.hpp>

namespace fc {
    // Stretch src to target_w x target_h. Returns src untouched when the size
    // already matches or the target is not positive.
    inline cv::Mat resize_frame(const cv::Mat& src,
                                int target_w,
                                int target_h,
                                int interp = cv::INTER_AREA) {
        if (target_w <= 0 || target_h <= 0) return src;
        if (src.cols == target_w && src.rows == target_h) return src;

        cv::Mat dst;
        cv::resize(src, dst, {target_w, target_h}, 0, 0, interp);
        return dst;
    }
}
