/**
 * @file util.h
 *
 *  Created on: 30.10.2021
 *      Author: andre
 */

#ifndef UTIL_H_
#define UTIL_H_

#include "glm/vec2.hpp"
#include <cmath>
#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

/**
 * Calculates the cross section of two lines which are defined using a position and a direction vector.
 * @param a_pos	Position on line A
 * @param a_dir Direction of line A. Normalization is not required
 * @param b_pos Position on line B
 * @param b_dir Direction of line B. Normalization is not required
 * @return		Position of cross section or nothing if the lines are parallel
 */
static std::optional<cv::Point2f> calculateLineIntercross(cv::Point2f a_pos, cv::Point2f a_dir, cv::Point2f b_pos,
														  cv::Point2f b_dir)
{
	glm::vec2 a(a_dir.x, a_dir.y);
	glm::vec2 b(b_dir.x, b_dir.y);
	glm::vec2 ab(b_pos.x - a_pos.x, b_pos.y - a_pos.y);

	// a_pos + t * a_dir = b_pos + s * b_dir solved with Cramer's rule
	float det = a.x * b.y - a.y * b.x;
	if (std::fabs(det) < 1e-6f)
		return std::nullopt;

	float t = (ab.x * b.y - ab.y * b.x) / det;

	return a_pos + t * a_dir;
}

/**
 * Calculates the average position for all provided points
 * @param in	Points to calculate the average from. Must not be empty
 * @return		Average positon
 */
template <class P> static cv::Point2f calculateAveragePosition(const std::vector<P>& in)
{
	cv::Point2f result(0, 0);
	for (const auto& p : in)
	{
		result.x += p.x;
		result.y += p.y;
	}

	result.x /= in.size();
	result.y /= in.size();

	return result;
}

/// OpenCV Color Green
static const cv::Scalar green{0, 255, 0};
/// OpenCV Color Blue
static const cv::Scalar blue{255, 0, 0};
/// OpenCV Color Red
static const cv::Scalar red{0, 0, 255};

#endif /* UTIL_H_ */
