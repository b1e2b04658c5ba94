/**
 * @file main_gridscan.cpp
 *
 *  Created on: 30.11.2021
 *      Author: andre
 */

#include "BitMatrix.h"
#include "FinderPatternDetector.h"
#include "PureBitsExtractor.h"
#include "util.h"
#include <opencv2/opencv.hpp>
#include <stdio.h>
#include <string.h>

/*
 * Reads the cells of a code from an already black and white image and prints them.
 * Usage: gridscan <image> [--pure] [--debug] [--visual]
 */
int main(int argc, char** argv)
{
	const char* filepath = nullptr;
	bool pure			 = false;
	bool debug			 = false;
	bool visual			 = false;

	for (int i = 1; i < argc; i++)
	{
		if (strcmp(argv[i], "--pure") == 0)
			pure = true;
		else if (strcmp(argv[i], "--debug") == 0)
			debug = true;
		else if (strcmp(argv[i], "--visual") == 0)
			visual = true;
		else
			filepath = argv[i];
	}

	if (!filepath)
	{
		printf("Usage: %s <image> [--pure] [--debug] [--visual]\n", argv[0]);
		return 1;
	}

	cv::Mat src_image = cv::imread(filepath, cv::IMREAD_GRAYSCALE);
	if (!src_image.data)
	{
		printf("No image data \n");
		return 1;
	}

	BitMatrix image = BitMatrix::fromMat(src_image);

	if (pure)
	{
		PureBitsExtractor extractor;
		extractor.debugMode = debug;

		auto bits = extractor.extract(image);
		if (!bits)
		{
			printf("%s: %s\n", bits.error().what(), bits.error().detail().c_str());
			return 2;
		}

		bits.value().print();
		return 0;
	}

	FinderPatternDetector detector;
	detector.debugMode = debug;

	DecodeHints hints;
	hints.tryHarder = true;

	auto detected = detector.detect(image, hints);
	if (!detected)
	{
		printf("%s: %s\n", detected.error().what(), detected.error().detail().c_str());
		return 2;
	}

	const auto& points = detected.value().points;
	printf("bottom left %f %f, top left %f %f, top right %f %f\n", points.at(0).x, points.at(0).y, points.at(1).x,
		   points.at(1).y, points.at(2).x, points.at(2).y);
	detected.value().bits.print();

	if (visual)
	{
		cv::Mat display;
		cv::cvtColor(src_image, display, cv::COLOR_GRAY2BGR);
		cv::circle(display, points.at(0), 10, blue, 2);
		cv::circle(display, points.at(1), 10, red, 2);
		cv::circle(display, points.at(2), 10, green, 2);
		cv::imshow("src_image", display);
		cv::waitKey(0);
	}

	return 0;
}
