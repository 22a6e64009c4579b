#include "utils.h"

#include <algorithm>
#include <numeric>
#include <sstream>

std::string ColorString(const std::string& s, const std::string& color)
{
    std::string code = "\x1b[34m";
    if (color == "R")
        code = "\x1b[31m";
    else if (color == "G")
        code = "\x1b[32m";
    else if (color == "Y")
        code = "\x1b[33m";
    else if (color == "info")
        code = "\x1b[36m";
    return code + s + "\x1b[0m";
}

std::tuple<float, bool> ConvertToNumber(const std::string& str)
{
    float f_r = 0.f;
    auto result = std::from_chars(str.data(), str.data() + str.size(), f_r);
    // "12abc" 这种只转换了一部分的也认为失败
    bool ok = result.ec == std::errc() && result.ptr == str.data() + str.size();
    return std::make_tuple(f_r, ok);
}

std::string trim_string(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_string(const std::string& s, char sep)
{
    std::vector<std::string> items;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep))
        items.push_back(trim_string(item));
    return items;
}

std::mt19937 make_generator(int seed)
{
    if (seed < 0)
    {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}

std::vector<int> random_queue(int n, std::mt19937& gen)
{
	std::vector<int> permutation(n);
	std::iota(permutation.begin(), permutation.end(), 0); // create list [0, 1, ..., n-1]

	// shuffle the order
	std::shuffle(permutation.begin(), permutation.end(), gen);

	return permutation;
}

float random_uniform(std::mt19937& gen, float start/* = 0.0f*/, float end/* = 1.0f*/)
{
	if (end <= start)
		return start;
	std::uniform_real_distribution<float> dis(start, end);
	return dis(gen);
}

int random_int(std::mt19937& gen, int low, int high)
{
	std::uniform_int_distribution<int> dis(low, high);
	return dis(gen);
}
