/**
 * @file FinderPatternDetector.h
 *
 *  Created on: 27.11.2021
 *      Author: andre
 */

#ifndef FINDERPATTERNDETECTOR_H_
#define FINDERPATTERNDETECTOR_H_

#define GLM_ENABLE_EXPERIMENTAL

#include "BitMatrix.h"
#include "Detector.h"
#include "GridSampler.h"
#include "glm/gtx/vector_angle.hpp"
#include "glm/vec2.hpp"
#include "util.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <opencv2/opencv.hpp>
#include <stdio.h>

/**
 * Corners of one finder pattern, sorted by their role in the code.
 */
class FinderPattern
{
  public:
	/// Corner which is also a corner of the whole code
	cv::Point2f outer;

	/// Corner facing the middle of the code. Diagonally across from \ref outer
	cv::Point2f inner;

	/// Unit vector pointing diagonally into the code
	glm::vec2 out_to_in;

	/// The two corners which are neither \ref outer nor \ref inner
	std::array<cv::Point2f, 2> sides;

	/// Edge of the code which starts at \ref outer and ends at the corner without a finder pattern.
	/// Only the direction is meaningful. Set by \ref findEdgeToFinderlessCorner
	cv::Point2f edge_to_finderless_corner;

	FinderPattern() = default;

	/**
	 * @param in		The 4 corners as they follow each other on the contour
	 * @param center	Approximate middle of the code. The corner nearest to it is \ref inner
	 */
	FinderPattern(const std::vector<cv::Point2f>& in, cv::Point2f center)
	{
		assert(in.size() == 4);

		int nearest = 0;
		for (int i = 1; i < 4; i++)
		{
			if (cv::norm(in.at(i) - center) < cv::norm(in.at(nearest) - center))
				nearest = i;
		}

		inner	 = in.at(nearest);
		outer	 = in.at((nearest + 2) % 4);
		sides[0] = in.at((nearest + 1) % 4);
		sides[1] = in.at((nearest + 3) % 4);

		out_to_in = glm::normalize(glm::vec2(inner.x - outer.x, inner.y - outer.y));
	}

	/// Average of all 4 corners
	cv::Point2f center() const
	{
		return (outer + inner + sides[0] + sides[1]) * 0.25f;
	}

	/**
	 * Only meaningful for the bottom left and the top right pattern.
	 * Of the two side corners, the one further away from the top left pattern lies on the
	 * outer edge that leads to the finderless corner.
	 *
	 * @param top_left_pattern	Pattern in the top left corner of the code
	 */
	void findEdgeToFinderlessCorner(const FinderPattern& top_left_pattern)
	{
		const cv::Point2f& far_side = cv::norm(top_left_pattern.outer - sides[0]) >
											  cv::norm(top_left_pattern.outer - sides[1])
										  ? sides[0]
										  : sides[1];
		edge_to_finderless_corner = far_side - outer;
	}
};

/**
 * Locates a Qr Code using its three finder patterns and rectifies it with a perspective transformation.
 *
 * The image is vectorized into a tree of polygons. A finder pattern is a square inside a square
 * inside a square. The missing fourth corner of the code is reconstructed from the edges of the
 * finder patterns.
 *
 * Doesn't keep any state between calls of \ref detect.
 */
class FinderPatternDetector : public Detector
{
  private:
	/// Data collected while searching for finder patterns in a single image
	struct Search
	{
		/// Image vectorized as a vector of polygons
		std::vector<std::vector<cv::Point>> contours;

		/// Tree structure of \ref contours
		std::vector<cv::Vec4i> hierarchy;

		/// Possible 4 corners of finder patterns. The order and orientation of points is undefined in this state.
		std::vector<std::vector<cv::Point2f>> finder_contour_points;

		/// Width * Height of the image
		float image_area;

		/// Reconstruct rounded squares instead of ignoring them
		bool try_harder;
	};

  public:
	/// Width and Height of perspective corrected image
	static constexpr int warped_size = 1000;

	/// Width of a finder pattern in cells
	static constexpr float kFinderPatternCells = 7.0f;

	/// Width of a version 1 code in cells
	static constexpr int kMinimumDimension = 21;

	/// Width of a version 40 code in cells
	static constexpr int kMaximumDimension = 177;

	/// If true, the class is more verbose
	bool debugMode{false};

	DecodeOutcome<DetectorResult> detect(const BitMatrix& image, const DecodeHints& hints) const override
	{
		cv::Mat monochrome_image_normal = image.toMat();
		cv::Mat monochrome_image_inverted;
		cv::bitwise_not(monochrome_image_normal, monochrome_image_inverted);

		Search search;
		search.image_area = static_cast<float>(image.getWidth()) * image.getHeight();
		search.try_harder = hints.isTryHarder();

		cv::findContours(monochrome_image_inverted, search.contours, search.hierarchy, cv::RETR_TREE,
						 cv::CHAIN_APPROX_TC89_KCOS);

		if (!search.contours.empty())
			searchFinderPatternPoints(search, 0, 0);

		if (search.finder_contour_points.size() != 3)
		{
			if (debugMode)
				printf("Found %zu finder patterns instead of 3\n", search.finder_contour_points.size());
			return DecodeError::notFound("Unable to detect Finder Pattern");
		}

		auto finders = orientFinderPatterns(search.finder_contour_points);
		FinderPattern& finder_bottom_left = finders[0];
		FinderPattern& finder_top_left	  = finders[1];
		FinderPattern& finder_top_right	  = finders[2];

		if (debugMode)
		{
			printf("finder top left %f %f\n", finder_top_left.outer.x, finder_top_left.outer.y);
			printf("finder top right %f %f\n", finder_top_right.outer.x, finder_top_right.outer.y);
			printf("finder bottom left %f %f\n", finder_bottom_left.outer.x, finder_bottom_left.outer.y);
		}

		finder_bottom_left.findEdgeToFinderlessCorner(finder_top_left);
		finder_top_right.findEdgeToFinderlessCorner(finder_top_left);

		auto bottom_right =
			calculateLineIntercross(finder_bottom_left.outer, finder_bottom_left.edge_to_finderless_corner,
									finder_top_right.outer, finder_top_right.edge_to_finderless_corner);
		if (!bottom_right)
			return DecodeError::notFound("Edges of the code are parallel");

		if (debugMode)
			printf("edge of code %f %f\n", bottom_right->x, bottom_right->y);

		cv::Point2f src[4];
		cv::Point2f dst[4];

		src[0] = finder_top_left.outer;
		src[1] = finder_top_right.outer;
		src[2] = *bottom_right;
		src[3] = finder_bottom_left.outer;

		dst[0] = cv::Point2f(0, 0);
		dst[1] = cv::Point2f(warped_size, 0);
		dst[2] = cv::Point2f(warped_size, warped_size);
		dst[3] = cv::Point2f(0, warped_size);

		cv::Mat transform = cv::getPerspectiveTransform(src, dst);

		cv::Mat monochrome_image_warped;
		cv::warpPerspective(monochrome_image_normal, monochrome_image_warped, transform,
							cv::Size(warped_size, warped_size), cv::INTER_NEAREST, cv::BORDER_CONSTANT,
							cv::Scalar(255));

		float cell_size = calculateCellSize(finders, transform);
		auto dimension	= computeDimension(cell_size);
		if (!dimension)
		{
			if (debugMode)
				printf("No valid size for cell size %f\n", cell_size);
			return dimension.error();
		}

		if (debugMode)
			printf("cellsize %f, size in cells %d\n", cell_size, dimension.value());

		DetectorResult result;
		result.bits = extractCells(BitMatrix::fromMat(monochrome_image_warped), dimension.value());
		result.points.push_back(finder_bottom_left.center());
		result.points.push_back(finder_top_left.center());
		result.points.push_back(finder_top_right.center());

		return result;
	}

	/**
	 * Qr Codes are 17 + 4 * version cells in size, with versions from 1 to 40.
	 * Rounds the measured size to the next valid one.
	 * @param cellSize	Size of a cell in the perspective corrected image
	 * @return			Width and height in cells or kNotFound
	 */
	static DecodeOutcome<int> computeDimension(float cellSize)
	{
		// Also keeps lround() away from values it can't represent
		if (!std::isfinite(cellSize) || cellSize < warped_size / (kMaximumDimension + 2.0f))
			return DecodeError::notFound("Cell size not measurable");

		int dimension = std::lround(warped_size / cellSize);
		switch (dimension & 0x03)
		{
		case 0:
			dimension++;
			break;
		case 2:
			dimension--;
			break;
		case 3:
			return DecodeError::notFound("Size in cells is not valid");
		}

		if (dimension < kMinimumDimension)
			return DecodeError::notFound("Code is too small");

		if (dimension > kMaximumDimension)
			return DecodeError::notFound("Code is too large");

		return dimension;
	}

	/**
	 * Sorts the detected patterns according to their position in the code.
	 * The top left pattern is the one whose neighbours face into opposite directions.
	 *
	 * @param finder_contour_points		Corners of exactly 3 finder patterns
	 * @return							Bottom left, top left and top right pattern
	 */
	static std::array<FinderPattern, 3> orientFinderPatterns(
		const std::vector<std::vector<cv::Point2f>>& finder_contour_points)
	{
		assert(finder_contour_points.size() == 3);

		std::vector<cv::Point2f> all_corners;
		for (const auto& c : finder_contour_points)
			all_corners.insert(all_corners.end(), c.begin(), c.end());

		cv::Point2f average_center_pos = calculateAveragePosition(all_corners);

		std::array<FinderPattern, 3> f;
		for (int i = 0; i < 3; i++)
			f[i] = FinderPattern(finder_contour_points.at(i), average_center_pos);

		// Angle between the two patterns which are not at index i
		std::array<float, 3> angles;
		angles[0] = std::fabs(glm::orientedAngle(f[1].out_to_in, f[2].out_to_in));
		angles[1] = std::fabs(glm::orientedAngle(f[0].out_to_in, f[2].out_to_in));
		angles[2] = std::fabs(glm::orientedAngle(f[0].out_to_in, f[1].out_to_in));

		int top_left = std::distance(angles.begin(), std::max_element(angles.begin(), angles.end()));
		int a		 = (top_left + 1) % 3;
		int b		 = (top_left + 2) % 3;

		// Going counterclockwise from the bottom left pattern to the top left one
		if (glm::orientedAngle(f[a].out_to_in, f[top_left].out_to_in) < 0)
			std::swap(a, b);

		return {f[a], f[top_left], f[b]};
	}

  private:
	/**
	 * Utility function to detect rounded squares and calculate the square which we are seeing here
	 * by removing rounded edges using \ref calculateLineIntercross
	 *
	 * @param inp	Contour with variable number of points
	 * @return		Empty vector in case of failure, exactly 4 points in case of success
	 */
	static std::vector<cv::Point2f> reconstructSquare(const std::vector<cv::Point>& inp)
	{
		std::vector<cv::Point> out2;
		cv::approxPolyDP(inp, out2, 3, true);

		// Calculate longest edge
		double max_len = 0;
		for (size_t i = 0; i < out2.size(); i++)
		{
			size_t j = (i + 1) % out2.size();
			max_len	 = std::max(max_len, cv::norm(out2.at(i) - out2.at(j)));
		}

		// Collect "long" edges
		std::vector<cv::Point2f> corner_points;
		std::vector<cv::Point2f> corner_dir;
		for (size_t i = 0; i < out2.size(); i++)
		{
			size_t j = (i + 1) % out2.size();
			if (cv::norm(out2.at(i) - out2.at(j)) > max_len / 2)
			{
				corner_points.push_back(out2.at(i));
				corner_dir.push_back(out2.at(j) - out2.at(i));
			}
		}

		// Do we have 4 edges? Nice! This is a square.. probably
		// Calculate the 4 intercrossing positions of the 4 edges to get a sharp edged square.
		std::vector<cv::Point2f> out_points;
		if (corner_points.size() != 4)
			return out_points;

		for (int i = 0; i < 4; i++)
		{
			auto corner = calculateLineIntercross(corner_points.at(i), corner_dir.at(i), corner_points.at((i + 1) % 4),
												  corner_dir.at((i + 1) % 4));
			if (!corner)
				return std::vector<cv::Point2f>();

			out_points.push_back(*corner);
		}

		return out_points;
	}

	/**
	 * Performs a depth search on the tree of contours.
	 * We define a Finder Pattern as a 4 corner shape inside a 4 corner shape inside another 4 corner shape.
	 * This function is recursive and calls itself with an incremented version of candidateForFinderPattern
	 * if the current contour is assumed to be a finder pattern square.
	 *
	 * @param search						Contours and collected patterns
	 * @param id 							Current index inside \ref Search::contours
	 * @param candidateForFinderPattern		Usually 0. Any higher number represents how deep we are inside an assumed
	 * 										finder pattern
	 */
	void searchFinderPatternPoints(Search& search, int id, int candidateForFinderPattern) const
	{
		for (;;)
		{
			double epsilon = 0.05 * cv::arcLength(search.contours.at(id), true);
			std::vector<cv::Point> out;
			cv::approxPolyDP(search.contours.at(id), out, epsilon, true);

			int nextparam = 0;
			double area	  = cv::contourArea(out);

			if (out.size() == 4 && area < search.image_area / 8)
			{
				if (candidateForFinderPattern == 2)
					collectFinderPattern(search, id);

				nextparam = candidateForFinderPattern + 1;
			}

			if (search.hierarchy.at(id)[2] >= 0)
				searchFinderPatternPoints(search, search.hierarchy.at(id)[2], nextparam);

			// Next contour on this level
			id = search.hierarchy.at(id)[0];
			if (id == -1)
				break;
		}
	}

	/**
	 * The innermost square of a finder pattern was found. Stores the corners of the outermost one.
	 * @param search	Contours and collected patterns
	 * @param id		Index of the innermost square
	 */
	void collectFinderPattern(Search& search, int id) const
	{
		int outer1 = search.hierarchy.at(id)[3];
		int outer2 = search.hierarchy.at(outer1)[3];

		std::vector<cv::Point> out2;
		cv::approxPolyDP(search.contours.at(outer2), out2, 3, true);

		if (out2.size() == 4)
		{
			if (debugMode)
				printf("Finder pattern at contour %d\n", outer2);

			search.finder_contour_points.emplace_back(out2.begin(), out2.end());
		}
		else if (search.try_harder)
		{
			auto square = reconstructSquare(search.contours.at(outer2));
			if (debugMode)
				printf("Finder pattern at contour %d reconstructed: %s\n", outer2, square.empty() ? "no" : "yes");

			if (square.size() == 4)
				search.finder_contour_points.push_back(square);
		}
	}

	/**
	 * Every finder pattern is 7x7 cells in size. Their edges in the perspective corrected image
	 * are used to calculate the size of a cell.
	 *
	 * @param finders	All 3 finder patterns
	 * @param transform	Perspective transformation to the warped image
	 * @return			Size of a cell in pixels of the warped image
	 */
	static float calculateCellSize(const std::array<FinderPattern, 3>& finders, const cv::Mat& transform)
	{
		std::vector<cv::Point2f> src2;
		for (const auto& f : finders)
		{
			src2.push_back(f.outer);
			src2.push_back(f.sides.at(0));
			src2.push_back(f.sides.at(1));
			src2.push_back(f.inner);
		}

		std::vector<cv::Point2f> dst2;
		cv::perspectiveTransform(src2, dst2, transform);

		std::vector<float> avgs;
		for (size_t i = 0; i < dst2.size(); i += 4)
		{
			avgs.push_back(cv::norm(dst2[i + 1] - dst2[i]));
			avgs.push_back(cv::norm(dst2[i + 2] - dst2[i]));
			avgs.push_back(cv::norm(dst2[i + 1] - dst2[i + 3]));
			avgs.push_back(cv::norm(dst2[i + 2] - dst2[i + 3]));
		}

		return (std::accumulate(avgs.begin(), avgs.end(), 0.0f) / avgs.size()) / kFinderPatternCells;
	}

	/**
	 * Reads all cells from the perspective corrected image
	 * @param warped		Perspective corrected image
	 * @param dimension		Width and height in cells
	 * @return				One element per cell
	 */
	static BitMatrix extractCells(const BitMatrix& warped, int dimension)
	{
		BitMatrix cells(dimension, dimension);
		float cell_size = static_cast<float>(warped_size) / dimension;

		for (int y = 0; y < dimension; y++)
		{
			int pixel_y = std::lround((y + 0.5f) * cell_size);
			for (int x = 0; x < dimension; x++)
			{
				int pixel_x = std::lround((x + 0.5f) * cell_size);
				cells.set(x, y, GridSampler::sample(warped, pixel_x, pixel_y, static_cast<int>(cell_size)));
			}
		}

		return cells;
	}
};

#endif /* FINDERPATTERNDETECTOR_H_ */
