#pragma once
#include <stdexcept>
#include <string>

// 配置错误：语言组合不支持、模型/字符文件缺失、解码参数非法。在任何图像处理之前抛出
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// 单个框无法裁剪（零面积、越界、不可透视校正）。由调用方逐框捕获并跳过
class DegenerateBoxError : public std::runtime_error {
public:
    explicit DegenerateBoxError(const std::string& msg) : std::runtime_error(msg) {}
};

// 检测/识别模型推理失败，原样向上传播
class OracleFailure : public std::runtime_error {
public:
    explicit OracleFailure(const std::string& msg) : std::runtime_error(msg) {}
};
