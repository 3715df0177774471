#include "yolo_dnn_backend.hpp"

#include <gtest/gtest.h>

TEST(Letterbox, KeepsAspectRatioAndPadsCentered)
{
    cv::Mat image(480, 640, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat out;
    Letterbox lb = letterbox_image(image, 320, out);

    EXPECT_FLOAT_EQ(lb.scale, 0.5f);
    EXPECT_EQ(lb.pad_x, 0);
    EXPECT_EQ(lb.pad_y, 40);
    ASSERT_EQ(out.size(), cv::Size(320, 320));

    // 上下灰边，中间为原图内容
    EXPECT_EQ(out.at<cv::Vec3b>(0, 160), cv::Vec3b(114, 114, 114));
    EXPECT_EQ(out.at<cv::Vec3b>(319, 160), cv::Vec3b(114, 114, 114));
    EXPECT_EQ(out.at<cv::Vec3b>(160, 160), cv::Vec3b(10, 20, 30));
}

TEST(Letterbox, BoxesMapBackToSourcePixels)
{
    Letterbox lb;
    lb.scale = 0.5f;
    lb.pad_y = 40;

    cv::Rect box = unletterbox_box(160.0f, 160.0f, 100.0f, 50.0f, lb, cv::Size(640, 480));
    EXPECT_EQ(box, cv::Rect(220, 190, 200, 100));

    // 落在填充区的部分被裁掉
    cv::Rect edge = unletterbox_box(20.0f, 40.0f, 40.0f, 20.0f, lb, cv::Size(640, 480));
    EXPECT_EQ(edge, cv::Rect(0, 0, 80, 20));
}
