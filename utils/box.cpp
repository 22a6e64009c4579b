#include "box.h"

#include <cmath>
#include <sstream>

Box Box::to_relative_size(float img_w, float img_h) const
{
    return Box(x / img_w, y / img_h, w / img_w, h / img_h);
}

std::array<cv::Point2f, 2> Box::to_opencv_format() const
{
    cv::Point2f p1(x - w / 2.f, y - h / 2.f);
    cv::Point2f p2(x + w / 2.f, y + h / 2.f);
    return { p1, p2 };
}

std::string Box::show_info() const
{
    std::stringstream ss;
    ss << "[" << x << ", " << y << ", " << w << ", " << h << "]";
    return ss.str();
}

Box convert_bbox(float x1, float y1, float x2, float y2)
{
    float xc = (x1 + x2) / 2.f;
    float yc = (y1 + y2) / 2.f;
    float w = std::fabs(x2 - x1);
    float h = std::fabs(y2 - y1);
    return Box(xc, yc, w, h);
}

Box convert_opencv_to_box(const std::array<cv::Point2f, 2>& corners)
{
    return convert_bbox(corners[0].x, corners[0].y, corners[1].x, corners[1].y);
}
