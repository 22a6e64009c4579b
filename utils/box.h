#pragma once

#include <array>
#include <string>

#include <opencv2/opencv.hpp>

// 中心点 + 宽高 表示的边框, 绝对坐标(像素)或相对坐标([0,1])取决于上下文
// 增强之后的相对 w, h 可能略大于1, 由调用方判定, 这里不做截断
struct Box
{
    float x = 0.f;  // x center
    float y = 0.f;  // y center
    float w = 0.f;
    float h = 0.f;

    Box() = default;
    Box(float _x, float _y, float _w, float _h) : x(_x), y(_y), w(_w), h(_h) {}

    // 除以图像的宽高, 得到相对坐标
    Box to_relative_size(float img_w, float img_h) const;
    // [(x1, y1), (x2, y2)] 左上/右下两个角点
    std::array<cv::Point2f, 2> to_opencv_format() const;

    std::string show_info() const;
};

// 一张图只对应一个label
struct LabelRecord
{
    Box box;
    std::string name;
};

// Convert bounding box coordinates from (x1, y1, x2, y2) format to (x, y, width, height) format.
// (x1, y1), (x2, y2) 不要求先后顺序, w, h 取绝对值
Box convert_bbox(float x1, float y1, float x2, float y2);

Box convert_opencv_to_box(const std::array<cv::Point2f, 2>& corners);
