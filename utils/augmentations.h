#pragma once

#include <array>
#include <random>
#include <tuple>

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#include "yaml_load.h"

struct AugmentParams
{
    float degrees = 5.0f;
    float translate = 0.1f;
    float scale = 0.2f;
    float shear = 2.0f;
    float perspective = 0.0f;
    float hsv_h = 0.015f;
    float hsv_s = 0.7f;
    float hsv_v = 0.4f;
    float fliplr = 0.5f;

    static AugmentParams from_cfgs(const VariantConfigs& hyp);
};

// image 为 RGB, gain 为0时对应的通道不变
void augment_hsv(cv::Mat& image, std::mt19937& gen, float hgain = 0.5, float sgain = 0.5, float vgain = 0.5);

// 对图像做随机仿射(透视)变换, 输出图像与输入同尺寸
// 边框的4个角点做同样的变换后取外接矩形, 不做截断, 越界由调用方判定
std::tuple<cv::Mat, std::array<cv::Point2f, 2>>
random_perspective(const cv::Mat& img,
    const std::array<cv::Point2f, 2>& box,
    std::mt19937& gen,
    float degrees,
    float translate,
    float scale,
    float shear,
    float perspective);

// random_perspective + 左右翻转 + HSV
std::tuple<cv::Mat, std::array<cv::Point2f, 2>>
random_transform(const cv::Mat& img, const std::array<cv::Point2f, 2>& box,
    const AugmentParams& hyp, std::mt19937& gen);

// 两个角点都在 [0, width] x [0, height] 之内
bool box_in_image(const std::array<cv::Point2f, 2>& box, float width, float height);

// RGB uint8 [h, w, 3] ==> float [3, h, w], 0~1
torch::Tensor preprocess_img(const cv::Mat& img);
