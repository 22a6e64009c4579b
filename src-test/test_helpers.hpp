#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <opencv2/opencv.hpp>

// 测试用的临时目录, 析构时删除
class TempDir
{
public:
	explicit TempDir(const std::string& name)
	{
		std::random_device rd;
		path = std::filesystem::temp_directory_path() / ("yolofeed_" + name + "_" + std::to_string(rd()));
		std::filesystem::create_directories(path);
	}
	~TempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	std::string file(const std::string& name) const { return (path / name).string(); }

	std::filesystem::path path;
};

inline void write_text(const std::string& filename, const std::string& text)
{
	std::ofstream out(filename);
	out << text;
}

// 纯色背景 + 一个矩形, BGR
inline void write_image(const std::string& filename, int width, int height, const cv::Scalar& color = cv::Scalar(40, 80, 120))
{
	cv::Mat img(height, width, CV_8UC3, color);
	cv::rectangle(img, cv::Point(width / 4, height / 4), cv::Point(width / 2, height / 2), cv::Scalar(200, 30, 30), cv::FILLED);
	cv::imwrite(filename, img);
}
