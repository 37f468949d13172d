#include <algorithm>
#include <iostream>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/highgui.hpp>

#include "config.hpp"
#include "image_utils.hpp"
#include "kitti_dataset.hpp"
#include "klt.hpp"

static void printUsage(const char *name)
{
    std::cerr << "Usage: " << name << " <kitti_dir> <sequence> [config.yaml] [every_k_frames]" << std::endl;
}

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        printUsage(argv[0]);
        return 1;
    }

    const std::string directory = argv[1];
    const std::string sequence = argv[2];

    try
    {
        KltParams params = argc > 3 ? KltParams::fromYaml(argv[3]) : KltParams();
        params.print(std::cout);

        const int everyKFrames = argc > 4 ? std::max(1, std::stoi(argv[4])) : 1;

        KITTIDatasetReader dataset(directory, sequence);
        std::cout << "- [Demo]: Calibration: " << *dataset.calib() << std::endl;

        OpenCVKLT klt(params);

        KittiFrame frame;

        while (dataset.nextFrame(frame))
        {
            if (frame.index % everyKFrames != 0)
            {
                continue;
            }

            TrackResult result = klt.process(frame.left);
            TrackMatches matches = klt.matches();

            std::cout << "- [Demo]: Frame " << frame.index << ": " << result.ids.size() << " tracks, "
                      << matches.ids.size() << " matches";

            if (frame.pose)
            {
                const Eigen::Vector3d t = frame.pose->translation();
                std::cout << ", t = [" << t.x() << ", " << t.y() << ", " << t.z() << "]";
            }

            std::cout << std::endl;

            cv::Mat out = ImageUtils::toColor(frame.left);
            klt.drawTracks(out, true, TrackColoring::Age);

            cv::imshow("KLT tracks", out);

            if (cv::waitKey(1) == 'q')
            {
                break;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "- [Demo]: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
