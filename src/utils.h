#pragma once

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#define GLOG_USE_GLOG_EXPORT
#include <glog/logging.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <tuple>
#include <charconv>
#include <random>
#include <string>
#include <vector>

// 终端彩色输出, color: "R" 红, "G" 绿, "Y" 黄, "info" 青, 其它为蓝
std::string ColorString(const std::string& s, const std::string& color = "B");

// try convert str to float(int), if success bool == true else false
std::tuple<float, bool> ConvertToNumber(const std::string& str);

// 去掉首尾的空白字符(包括windows换行留下的\r)
std::string trim_string(const std::string& s);
std::vector<std::string> split_string(const std::string& s, char sep);

// 随机数统一由调用方传入的generator产生, 保证指定seed时结果可以复现
// seed < 0 时使用std::random_device
std::mt19937 make_generator(int seed);

// Generate an incremental queue and randomly shuffle the order
std::vector<int> random_queue(int n, std::mt19937& gen);
float random_uniform(std::mt19937& gen, float start = 0.0f, float end = 1.0f);
int random_int(std::mt19937& gen, int low, int high);   // [low, high]
