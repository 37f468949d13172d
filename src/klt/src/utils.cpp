#include "utils.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <Eigen/Geometry>

Sophus::SE3d Utils::poseFromRow(const double *row)
{
    Eigen::Matrix3d R;
    R << row[0], row[1], row[2],
         row[4], row[5], row[6],
         row[8], row[9], row[10];

    Eigen::Vector3d t(row[3], row[7], row[11]);

    // Stored rotations are only orthonormal up to the file precision
    Eigen::Quaterniond q(R);
    q.normalize();

    return Sophus::SE3d(q, t);
}

std::vector<Sophus::SE3d> Utils::loadKittiPoses(const std::string &filename)
{
    std::ifstream file(filename);

    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open pose file " + filename);
    }

    std::vector<double> values;
    double v;

    while (file >> v)
    {
        values.push_back(v);
    }

    if (!file.eof())
    {
        throw std::runtime_error("Pose file " + filename + " contains a non-numeric value");
    }

    if (values.size() % 12 != 0)
    {
        throw std::runtime_error("Pose file " + filename + " does not contain 12 values per pose");
    }

    std::vector<Sophus::SE3d> poses;
    poses.reserve(values.size() / 12);

    for (size_t i = 0; i < values.size(); i += 12)
    {
        poses.push_back(poseFromRow(&values[i]));
    }

    return poses;
}

std::string Utils::posesToString(const std::vector<Sophus::SE3d> &poses)
{
    std::ostringstream ss;
    ss << std::setprecision(12);

    for (size_t k = 0; k < poses.size(); k++)
    {
        if (k > 0)
        {
            ss << "\r\n";
        }

        Eigen::Matrix<double, 3, 4> P = poses[k].matrix3x4();

        for (int r = 0; r < 3; r++)
        {
            for (int c = 0; c < 4; c++)
            {
                if (r > 0 || c > 0)
                {
                    ss << " ";
                }
                ss << P(r, c);
            }
        }
    }

    return ss.str();
}

Eigen::MatrixXd Utils::posesToMatrix(const std::vector<Sophus::SE3d> &poses)
{
    Eigen::MatrixXd mat(poses.size(), 12);

    for (size_t k = 0; k < poses.size(); k++)
    {
        Eigen::Matrix<double, 3, 4> P = poses[k].matrix3x4();

        for (int r = 0; r < 3; r++)
        {
            for (int c = 0; c < 4; c++)
            {
                mat(k, r * 4 + c) = P(r, c);
            }
        }
    }

    return mat;
}

std::string Utils::expandUser(const std::string &path)
{
    if (path.empty() || path[0] != '~')
    {
        return path;
    }

    const char *home = std::getenv("HOME");

    if (home == nullptr)
    {
        return path;
    }

    return std::string(home) + path.substr(1);
}

std::string Utils::formatTemplate(const std::string &pattern, int index)
{
    int conversions = 0;

    for (size_t i = 0; i < pattern.size(); i++)
    {
        if (pattern[i] != '%')
        {
            continue;
        }

        i++;

        if (i < pattern.size() && pattern[i] == '%')
        {
            continue;
        }

        while (i < pattern.size() && (pattern[i] == '0' || pattern[i] == '-' || pattern[i] == '+' || pattern[i] == ' '))
        {
            i++;
        }

        while (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i])))
        {
            i++;
        }

        if (i >= pattern.size() || (pattern[i] != 'i' && pattern[i] != 'd'))
        {
            throw std::runtime_error("Invalid file template '" + pattern + "': only integer conversions are allowed");
        }

        conversions++;
    }

    if (conversions != 1)
    {
        throw std::runtime_error("Invalid file template '" + pattern + "': expected one index conversion, found " + std::to_string(conversions));
    }

    return cv::format(pattern.c_str(), index);
}
