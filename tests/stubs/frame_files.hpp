#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

/**
 * @brief Temporary directory of solid-colour PNG frames, removed on destruction
 */
class FrameFiles
{
public:
    explicit FrameFiles(const std::string &name)
        : dir_(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~FrameFiles()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FrameFiles(const FrameFiles &) = delete;
    FrameFiles &operator=(const FrameFiles &) = delete;

    // Writes a frame whose blue channel is `blue`; returns its path
    std::string write(int blue, int width = 100, int height = 100)
    {
        std::string path = (dir_ / ("frame_" + std::to_string(count_++) + ".png")).string();
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(blue, 0, 0));
        cv::imwrite(path, image);
        return path;
    }

    std::vector<std::string> writeAll(const std::vector<int> &blues)
    {
        std::vector<std::string> paths;
        for (int blue : blues)
        {
            paths.push_back(write(blue));
        }
        return paths;
    }

    std::string missing() const { return (dir_ / "does_not_exist.png").string(); }

    std::string garbage()
    {
        std::string path = (dir_ / "garbage.png").string();
        std::ofstream(path) << "not an image";
        return path;
    }

private:
    std::filesystem::path dir_;
    int count_ = 0;
};
