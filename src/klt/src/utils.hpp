#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <Eigen/Core>
#include <sophus/se3.hpp>

class Utils
{
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    // Rigid transform from the row-major top 3x4 block of a 4x4 matrix
    static Sophus::SE3d poseFromRow(const double *row);

    // Reads a KITTI pose file: 12 whitespace-separated values per pose
    static std::vector<Sophus::SE3d> loadKittiPoses(const std::string &filename);

    static std::string posesToString(const std::vector<Sophus::SE3d> &poses);

    // N x 12 matrix, one flattened 3x4 pose per row
    static Eigen::MatrixXd posesToMatrix(const std::vector<Sophus::SE3d> &poses);

    // Expands a leading ~ with $HOME
    static std::string expandUser(const std::string &path);

    // Formats a printf-style file template ("image_0/%06i.png") with an index.
    // The template must hold exactly one integer conversion, "%%" is a literal percent.
    static std::string formatTemplate(const std::string &pattern, int index);
};
