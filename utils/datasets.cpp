#include <filesystem>
#include <random>
#include <algorithm> // std::shuffle
#include <fstream>
#include <cmath>
#include <set>

#include "datasets.h"
#include "utils.h"

int load_dataset(const std::string& annotation_file, char sep,
	std::vector<std::string>& x, std::vector<LabelRecord>& y)
{
	std::ifstream file(annotation_file);
	TORCH_CHECK(file.is_open(), "open annotation file ", annotation_file, " failed.");

	auto root = std::filesystem::path(annotation_file).parent_path();
	int oldfound = static_cast<int>(x.size());
	int line_no = 0;
	std::string line;
	while (std::getline(file, line))
	{
		line_no++;
		line = trim_string(line);
		if (line.empty() || line[0] == '#')
			continue;

		auto items = split_string(line, sep);
		if (items.size() != 6)
		{
			LOG(WARNING) << annotation_file << ":" << line_no << " expected 6 fields, got " << items.size() << ", skipped.";
			continue;
		}

		float coords[4];
		bool numeric = true;
		for (int i = 0; i < 4; i++)
		{
			auto [v, ok] = ConvertToNumber(items[i + 1]);
			coords[i] = v;
			numeric = numeric && ok;
		}
		if (!numeric)
		{
			if (line_no > 1)
				LOG(WARNING) << annotation_file << ":" << line_no << " coordinates not numeric, skipped.";
			continue;		// 表头
		}

		auto img_path = std::filesystem::path(items[0]);
		if (img_path.is_relative())
			img_path = root / img_path;

		LabelRecord record;
		record.box = convert_bbox(coords[0], coords[1], coords[2], coords[3]);
		record.name = items[5];
		x.emplace_back(img_path.string());
		y.emplace_back(record);
	}

	int found = static_cast<int>(x.size()) - oldfound;
	LOG(INFO) << "load " << found << " labels from " << annotation_file;
	return found;
}

std::vector<std::string> load_categories(const std::string& filename)
{
	std::ifstream file(filename);
	TORCH_CHECK(file.is_open(), "open categories file ", filename, " failed.");

	std::vector<std::string> names;
	std::string line;
	while (std::getline(file, line))
	{
		line = trim_string(line);
		if (!line.empty())
			names.push_back(line);
	}
	TORCH_CHECK(!names.empty(), "categories file ", filename, " is empty.");
	return names;
}

void check_single_box_per_image(const std::vector<std::string>& x)
{
	std::set<std::string> seen;
	for (const auto& path : x)
	{
		TORCH_CHECK(seen.insert(path).second, "image ", path,
			" has more than one label, only one box per image is supported.");
	}
}

std::map<std::string, int> calc_augment_level(const std::vector<LabelRecord>& y, int scaling_factor/* = 5*/)
{
	// 统计每个类别的图像数量
	std::map<std::string, int> frequencies;
	for (const auto& record : y)
		frequencies[record.name]++;

	std::map<std::string, int> level;
	if (frequencies.empty())
		return level;

	double mean = double(y.size()) / double(frequencies.size());	// average images per class
	for (const auto& [name, freq] : frequencies)
		level[name] = int(std::floor(scaling_factor * (mean / freq)));
	return level;
}

int scaled_input_size(int img_input, float multi_scale)
{
	// 直接int()截断时 416*0.7692308 这类数据会得到319, 用四舍五入
	return static_cast<int>(std::lround(img_input * multi_scale));
}

void SampleSet::shuffle(std::mt19937& gen)
{
	auto order = random_queue(static_cast<int>(images.size()), gen);
	std::vector<torch::Tensor> new_images, new_labels;
	std::vector<int64_t> new_indices;
	new_images.reserve(order.size());
	new_labels.reserve(order.size());
	new_indices.reserve(order.size());
	for (int i : order)
	{
		new_images.push_back(images[i]);
		new_labels.push_back(labels[i]);
		new_indices.push_back(indices[i]);
	}
	images.swap(new_images);
	labels.swap(new_labels);
	indices.swap(new_indices);
}

SampleBuilder::SampleBuilder(const std::vector<std::string>& class_names,
	std::shared_ptr<LabelEncoder> _encoder,
	int _img_input,
	bool _augment,
	const AugmentParams& _hyp)
	: encoder(std::move(_encoder)), img_input(_img_input), augment(_augment), hyp(_hyp)
{
	TORCH_CHECK(encoder != nullptr, "SampleBuilder needs a label encoder.");
	for (int i = 0; i < int(class_names.size()); i++)
		name_to_index.emplace(class_names[i], i);
}

int SampleBuilder::class_index(const std::string& name) const
{
	auto it = name_to_index.find(name);
	TORCH_CHECK(it != name_to_index.end(), "class ", name, " not in the categories list.");
	return it->second;
}

torch::Tensor SampleBuilder::make_label(const Box& rel_box, const torch::Tensor& code) const
{
	auto head = torch::tensor({ rel_box.x, rel_box.y, rel_box.w, rel_box.h, 1.0f }, torch::kFloat32);
	return torch::cat({ head, code }, 0);
}

SampleSet SampleBuilder::build(const std::vector<std::string>& paths,
	const std::vector<LabelRecord>& labels,
	const std::vector<int64_t>& src_indices,
	float multi_scale,
	std::mt19937& gen) const
{
	TORCH_CHECK(paths.size() == labels.size() && paths.size() == src_indices.size(),
		"paths, labels and indices must have the same length.");

	SampleSet out;
	int new_size = augment ? scaled_input_size(img_input, multi_scale) : img_input;

	for (size_t i = 0; i < paths.size(); i++)
	{
		const auto& filename = paths[i];
		const auto& bbox = labels[i].box;
		const auto& name = labels[i].name;

		if (!std::filesystem::is_regular_file(filename))
		{
			LOG(WARNING) << "Image Not Found: " << filename;
			out.missing++;
			continue;
		}
		cv::Mat img = cv::imread(filename, cv::IMREAD_COLOR);
		if (img.empty())
		{
			LOG(ERROR) << "load image: " << filename << " failed.";
			out.missing++;
			continue;
		}
		cv::cvtColor(img, img, cv::COLOR_BGR2RGB);
		float width = static_cast<float>(img.cols);
		float height = static_cast<float>(img.rows);

		cv::Mat resized;
		cv::resize(img, resized, cv::Size(img_input, img_input));
		// Multi-scale training
		if (augment && new_size != img_input)
			cv::resize(resized, resized, cv::Size(new_size, new_size));

		auto code = encoder->encode_label(class_index(name));

		// 相对坐标以原图尺寸为准
		Box rel_box = bbox.to_relative_size(width, height);
		out.images.push_back(preprocess_img(resized));
		out.labels.push_back(make_label(rel_box, code));
		out.indices.push_back(src_indices[i]);

		if (!augment)
			continue;

		auto it = augment_level.find(name);
		int aug_level = it == augment_level.end() ? 0 : it->second;
		auto corners = bbox.to_opencv_format();
		for (int l = 0; l < aug_level; l++)
		{
			auto [aug_img, aug_box] = random_transform(img, corners, hyp, gen);

			// if box is out-of-bound, skip to next one
			if (!box_in_image(aug_box, width, height))
			{
				VLOG(1) << "augmented box " << convert_opencv_to_box(aug_box).show_info() << " out of image, "
					<< filename << " variant " << l << " dropped.";
				out.rejected++;
				continue;
			}

			cv::resize(aug_img, aug_img, cv::Size(new_size, new_size));
			Box aug_rel = convert_opencv_to_box(aug_box).to_relative_size(width, height);
			out.images.push_back(preprocess_img(aug_img));
			out.labels.push_back(make_label(aug_rel, code));
			out.indices.push_back(src_indices[i]);
			out.augmented++;
		}
	}

	return out;
}
