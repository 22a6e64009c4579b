#pragma once
#include <tuple>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#include "box.h"
#include "hierarchy.h"
#include "augmentations.h"

// ========================  数据列表 =================================
// 标注文件每行: path, x1, y1, x2, y2, class_name (像素坐标的左上/右下角点)
// 第一行如果坐标不是数字, 当作表头跳过; 相对路径以标注文件所在目录为根
// x 与 y 一一对应
int load_dataset(const std::string& annotation_file, char sep,
	std::vector<std::string>& x, std::vector<LabelRecord>& y);

// 每行一个类别名
std::vector<std::string> load_categories(const std::string& filename);

// 一张图只能对应一个label, 同一个路径出现两次视为数据错误
void check_single_box_per_image(const std::vector<std::string>& x);

// 每个类别的增强数量: int(scaling_factor * mean / frequency), 数量少的类别增强的多
std::map<std::string, int> calc_augment_level(const std::vector<LabelRecord>& y, int scaling_factor = 5);

// multi_scale 后的输入尺寸
int scaled_input_size(int img_input, float multi_scale);

// ========================  Sample Builder =================================
// 一个slice展开后的样本, images/labels/indices 三者一一对应
// label = [xc, yc, w, h, 1, class encoding...]
struct SampleSet
{
	std::vector<torch::Tensor> images;
	std::vector<torch::Tensor> labels;
	std::vector<int64_t> indices;		// 对应原始数据列表中的位置, 增强样本与原图相同

	int missing = 0;		// 找不到(或读取失败)的图像
	int augmented = 0;		// 生成的增强样本
	int rejected = 0;		// 边框越界被丢弃的增强样本

	size_t size() const { return images.size(); }
	// images/labels/indices 同步打乱
	void shuffle(std::mt19937& gen);
};

class SampleBuilder
{
public:
	SampleBuilder(const std::vector<std::string>& class_names,
		std::shared_ptr<LabelEncoder> encoder,
		int img_input,
		bool augment,
		const AugmentParams& hyp);

	void set_augment_level(const std::map<std::string, int>& level) { augment_level = level; }
	const std::map<std::string, int>& get_augment_level() const { return augment_level; }

	int class_index(const std::string& name) const;
	int label_size() const { return 5 + encoder->size(); }

	SampleSet build(const std::vector<std::string>& paths,
		const std::vector<LabelRecord>& labels,
		const std::vector<int64_t>& src_indices,
		float multi_scale,
		std::mt19937& gen) const;

private:
	torch::Tensor make_label(const Box& rel_box, const torch::Tensor& code) const;

	std::unordered_map<std::string, int> name_to_index;
	std::shared_ptr<LabelEncoder> encoder;
	int img_input = 416;
	bool augment = true;
	AugmentParams hyp;
	std::map<std::string, int> augment_level;
};
