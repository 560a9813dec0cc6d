#include <gtest/gtest.h>
#include "crop_normalizer.h"
#include "errors.h"

static cv::Mat noise_image(int rows, int cols) {
    cv::Mat img(rows, cols, CV_8UC1);
    cv::randu(img, 0, 256);
    return img;
}

static HorizontalBox hbox(int x0, int x1, int y0, int y1) {
    HorizontalBox h;
    h.x_min = x0;
    h.x_max = x1;
    h.y_min = y0;
    h.y_max = y1;
    return h;
}

TEST(CropNormalizer, HorizontalCropHasFixedHeightAndAspect) {
    cv::Mat grey = noise_image(100, 200);
    CropNormalizer norm;
    LineCrop c = norm.rectify(hbox(10, 110, 20, 40), grey, 3);
    EXPECT_EQ(c.box_id, 3);
    EXPECT_EQ(c.angle, 0);
    EXPECT_EQ(c.image.rows, 64);
    EXPECT_EQ(c.image.cols, 320);
    EXPECT_EQ(c.pad.valid_width, 320);
    EXPECT_EQ(c.pad.padded_width, 320);
    EXPECT_EQ(c.box[0], cv::Point2f(10, 20));
    EXPECT_EQ(c.box[2], cv::Point2f(110, 40));
}

TEST(CropNormalizer, BoxIsClippedToImage) {
    cv::Mat grey = noise_image(50, 80);
    CropNormalizer::Params p;
    p.img_h = 32;
    LineCrop c = CropNormalizer(p).rectify(hbox(-5, 60, -3, 20), grey, 0);
    EXPECT_EQ(c.image.rows, 32);
    EXPECT_EQ(c.box[0], cv::Point2f(0, 0));
    // 60 x 20 -> 96 x 32
    EXPECT_EQ(c.image.cols, 96);
}

TEST(CropNormalizer, FreeBoxIsRectifiedToStripHeight) {
    cv::Mat grey = noise_image(200, 200);
    FreeBox fb;
    // 旋转约 30 度的 100 x 20 矩形
    fb.points = {cv::Point2f(50, 50), cv::Point2f(136.6f, 100), cv::Point2f(126.6f, 117.3f), cv::Point2f(40, 67.3f)};
    fb.sources = {0};
    CropNormalizer norm;
    LineCrop c = norm.rectify(fb, grey, 1);
    EXPECT_EQ(c.image.rows, 64);
    double ratio = (double) c.image.cols / c.image.rows;
    EXPECT_NEAR(ratio, 5.0, 0.4);
    EXPECT_EQ(c.box_id, 1);
}

TEST(CropNormalizer, ZeroAreaBoxIsDegenerate) {
    cv::Mat grey = noise_image(50, 80);
    CropNormalizer norm;
    EXPECT_THROW(norm.rectify(hbox(10, 10, 5, 30), grey, 0), DegenerateBoxError);
    EXPECT_THROW(norm.rectify(hbox(300, 400, 5, 30), grey, 0), DegenerateBoxError);

    FreeBox collapsed;
    collapsed.points = {cv::Point2f(10, 10), cv::Point2f(10, 10), cv::Point2f(10, 10), cv::Point2f(10, 10)};
    EXPECT_THROW(norm.rectify(collapsed, grey, 0), DegenerateBoxError);

    FreeBox outside;
    outside.points = {cv::Point2f(500, 500), cv::Point2f(600, 500), cv::Point2f(600, 520), cv::Point2f(500, 520)};
    EXPECT_THROW(norm.rectify(outside, grey, 0), DegenerateBoxError);
}

TEST(CropNormalizer, InvalidHeightIsRejected) {
    CropNormalizer::Params p;
    p.img_h = 0;
    EXPECT_THROW(CropNormalizer{p}, ConfigurationError);
}

TEST(CropNormalizer, PaddingRecordsValidWidth) {
    std::vector<LineCrop> crops(2);
    crops[0].image = cv::Mat(64, 100, CV_8UC1, cv::Scalar(10));
    crops[1].image = cv::Mat(64, 50, CV_8UC1, cv::Scalar(20));
    int w = CropNormalizer::pad_to_common_width(crops);
    EXPECT_EQ(w, 100);
    EXPECT_EQ(crops[0].pad.valid_width, 100);
    EXPECT_EQ(crops[1].pad.valid_width, 50);
    EXPECT_EQ(crops[1].pad.padded_width, 100);
    EXPECT_EQ(crops[1].image.cols, 100);
    // 补齐部分复制最后一列
    EXPECT_EQ(crops[1].image.at<uchar>(10, 99), 20);
}

TEST(CropNormalizer, LowContrastIsStretched) {
    cv::Mat img(20, 20, CV_8UC1, cv::Scalar(100));
    img(cv::Rect(0, 0, 10, 20)).setTo(104);
    cv::Mat before = img.clone();
    CropNormalizer::adjust_contrast(img, 0.5f);
    EXPECT_GT(cv::countNonZero(img != before), 0);
    double lo, hi;
    cv::minMaxLoc(img, &lo, &hi);
    EXPECT_GT(lo, 100.0);
}

TEST(CropNormalizer, HighContrastIsLeftAlone) {
    cv::Mat img(20, 20, CV_8UC1, cv::Scalar(0));
    img(cv::Rect(0, 0, 10, 20)).setTo(255);
    cv::Mat before = img.clone();
    CropNormalizer::adjust_contrast(img, 0.5f);
    EXPECT_EQ(cv::countNonZero(img != before), 0);
}
