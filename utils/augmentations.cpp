#include "augmentations.h"
#include "utils.h"

#include <cmath>
#include <cstring>

AugmentParams AugmentParams::from_cfgs(const VariantConfigs& hyp)
{
	AugmentParams p;
	p.degrees = get_cfg_float(hyp, "degrees");
	p.translate = get_cfg_float(hyp, "translate");
	p.scale = get_cfg_float(hyp, "scale");
	p.shear = get_cfg_float(hyp, "shear");
	p.perspective = get_cfg_float(hyp, "perspective");
	p.hsv_h = get_cfg_float(hyp, "hsv_h");
	p.hsv_s = get_cfg_float(hyp, "hsv_s");
	p.hsv_v = get_cfg_float(hyp, "hsv_v");
	p.fliplr = get_cfg_float(hyp, "fliplr");
	return p;
}

void augment_hsv(cv::Mat& image, std::mt19937& gen, float hgain/* = 0.5*/, float sgain/* = 0.5*/, float vgain/* = 0.5*/)
{
	if (hgain == 0.f && sgain == 0.f && vgain == 0.f)
		return;

	// 生成随机增益 [-1,1]*gain + 1
	float r[3] = {
		random_uniform(gen, -1.0f, 1.0f) * hgain + 1.0f,
		random_uniform(gen, -1.0f, 1.0f) * sgain + 1.0f,
		random_uniform(gen, -1.0f, 1.0f) * vgain + 1.0f
	};

	// 转换到HSV空间, 数据流中的图像已经是RGB
	cv::Mat hsv;
	cv::cvtColor(image, hsv, cv::COLOR_RGB2HSV);

	std::vector<cv::Mat> channels;
	cv::split(hsv, channels);

	// 创建LUT
	cv::Mat lut_hue(1, 256, CV_8U);
	cv::Mat lut_sat(1, 256, CV_8U);
	cv::Mat lut_val(1, 256, CV_8U);

	for (int i = 0; i < 256; ++i) {
		lut_hue.at<uchar>(i) = static_cast<uchar>(int(i * r[0]) % 180);
		lut_sat.at<uchar>(i) = cv::saturate_cast<uchar>(i * r[1]);
		lut_val.at<uchar>(i) = cv::saturate_cast<uchar>(i * r[2]);
	}

	cv::LUT(channels[0], lut_hue, channels[0]);
	cv::LUT(channels[1], lut_sat, channels[1]);
	cv::LUT(channels[2], lut_val, channels[2]);

	cv::merge(channels, hsv);
	cv::cvtColor(hsv, image, cv::COLOR_HSV2RGB);
}

std::tuple<cv::Mat, std::array<cv::Point2f, 2>>
random_perspective(const cv::Mat& img,
	const std::array<cv::Point2f, 2>& box,
	std::mt19937& gen,
	float degrees,
	float translate,
	float scale,
	float shear,
	float perspective)
{
	auto height = img.rows;
	auto width = img.cols;

	// Center
	auto C = torch::eye(3);
	C[0][2] = -(img.cols / 2.0f);	// x translation(pixels)
	C[1][2] = -(img.rows / 2.0f);	// y translation(pixels)

	auto P = torch::eye(3);
	P[2][0] = random_uniform(gen, -perspective, perspective); // x perspective (about y)
	P[2][1] = random_uniform(gen, -perspective, perspective); // y perspective (about x)

	// Rotation and Scale
	auto R = torch::eye(3);
	auto a = random_uniform(gen, -degrees, degrees);
	auto s = random_uniform(gen, 1 - scale, 1 + scale);
	float rad = a * M_PI / 180.0f;
	float cos_val = s * cos(rad);
	float sin_val = s * sin(rad);
	R.index_put_({ 0, 0 }, cos_val);
	R.index_put_({ 0, 1 }, -sin_val);
	R.index_put_({ 1, 0 }, sin_val);
	R.index_put_({ 1, 1 }, cos_val);

	// Shear
	auto S = torch::eye(3);
	S[0][1] = tan(random_uniform(gen, -shear, shear) * M_PI / 180); // x shear (deg)
	S[1][0] = tan(random_uniform(gen, -shear, shear) * M_PI / 180); // y shear(deg)

	// Translation
	auto T = torch::eye(3);
	T[0][2] = random_uniform(gen, 0.5 - translate, 0.5 + translate) * width;  // x translation(pixels)
	T[1][2] = random_uniform(gen, 0.5 - translate, 0.5 + translate) * height;  // y translation(pixels)

	// 注意，这段代码顺序不能乱
	auto M = T.matmul(S).matmul(R).matmul(P).matmul(C).contiguous();

	cv::Mat output = img;
	bool need_transform = (M != torch::eye(3, torch::kFloat32)).any().item<bool>();
	if (need_transform)
	{
		cv::Mat cv_M(3, 3, CV_32F);
		cv::Scalar border_value = { 114, 114, 114 };
		std::memcpy(cv_M.data, M.data_ptr(), M.numel() * sizeof(float));

		if (perspective) {
			cv::warpPerspective(img, output, cv_M, cv::Size(width, height),
				cv::INTER_LINEAR, cv::BORDER_CONSTANT, border_value);
		}
		else {
			cv::Mat affine_M = cv_M(cv::Rect(0, 0, 3, 2));
			cv::warpAffine(img, output, affine_M, cv::Size(width, height),
				cv::INTER_LINEAR, cv::BORDER_CONSTANT, border_value);
		}
	}

	// 4个角点 (x1y1, x2y2, x1y2, x2y1), 坐标体系与图像同等transform
	auto xy = torch::ones({ 4, 3 }, torch::kFloat32);
	float x1 = box[0].x, y1 = box[0].y, x2 = box[1].x, y2 = box[1].y;
	xy.index_put_({ torch::indexing::Slice(), torch::indexing::Slice(0, 2) },
		torch::tensor({ x1, y1, x2, y2, x1, y2, x2, y1 }).reshape({ 4, 2 }));
	xy = xy.matmul(M.t());

	// 是否透视效果
	if (perspective) {
		auto xy_div = xy.index({ torch::indexing::Slice(), 2 }).unsqueeze(1);
		xy = xy.index({ torch::indexing::Slice(), torch::indexing::Slice(0, 2) }).div(xy_div);
	}
	else {
		xy = xy.index({ torch::indexing::Slice(), torch::indexing::Slice(0, 2) });
	}

	auto x = xy.index({ torch::indexing::Slice(), 0 });
	auto y = xy.index({ torch::indexing::Slice(), 1 });
	std::array<cv::Point2f, 2> newbox = {
		cv::Point2f(x.min().item<float>(), y.min().item<float>()),
		cv::Point2f(x.max().item<float>(), y.max().item<float>())
	};

	return { output, newbox };
}

std::tuple<cv::Mat, std::array<cv::Point2f, 2>>
random_transform(const cv::Mat& img, const std::array<cv::Point2f, 2>& box,
	const AugmentParams& hyp, std::mt19937& gen)
{
	auto [aug_img, aug_box] = random_perspective(img, box, gen,
		hyp.degrees, hyp.translate, hyp.scale, hyp.shear, hyp.perspective);
	// warpAffine输出的是新的Mat, 不会改到原图; 未做变换时需要clone
	if (aug_img.data == img.data)
		aug_img = img.clone();

	if (random_uniform(gen) < hyp.fliplr)
	{
		cv::flip(aug_img, aug_img, 1);
		float w = static_cast<float>(aug_img.cols);
		float x1 = w - aug_box[1].x;
		float x2 = w - aug_box[0].x;
		aug_box[0].x = x1;
		aug_box[1].x = x2;
	}

	augment_hsv(aug_img, gen, hyp.hsv_h, hyp.hsv_s, hyp.hsv_v);

	return { aug_img, aug_box };
}

bool box_in_image(const std::array<cv::Point2f, 2>& box, float width, float height)
{
	for (const auto& p : box)
	{
		if (width - p.x < 0 || height - p.y < 0)
			return false;
		if (p.x < 0 || p.y < 0)
			return false;
	}
	return true;
}

torch::Tensor preprocess_img(const cv::Mat& img)
{
	TORCH_CHECK(img.type() == CV_8UC3, "preprocess_img expects CV_8UC3 input.");
	cv::Mat cont = img.isContinuous() ? img : img.clone();
	auto img_tensor = torch::from_blob(cont.data, { cont.rows, cont.cols, 3 }, torch::kByte)
		.permute({ 2, 0, 1 })		// [h, w, c] ==>[c, h, w]
		.to(torch::kFloat32)
		.div_(255.f);
	return img_tensor.contiguous();
}
