/**
 * @file BitMatrix.h
 *
 *  Created on: 22.11.2021
 *      Author: andre
 */

#ifndef BITMATRIX_H_
#define BITMATRIX_H_

#include <cassert>
#include <opencv2/opencv.hpp>
#include <optional>
#include <stdio.h>
#include <vector>

/**
 * Monochrome image or grid of cells.
 * true is a black pixel / cell, false a white one.
 * Access is done with x going to the right and y going down, starting at 0.
 */
class BitMatrix
{
  private:
	/// Vector of rows
	std::vector<std::vector<bool>> bits_;

	int width_{0};
	int height_{0};

  public:
	BitMatrix() = default;

	/**
	 * Constructs a matrix with every element being white
	 * @param width		Number of columns. Must be positive
	 * @param height	Number of rows. Must be positive
	 */
	BitMatrix(int width, int height) : width_(width), height_(height)
	{
		assert(width > 0 && height > 0);
		for (int y = 0; y < height; y++)
		{
			bits_.emplace_back(std::vector<bool>(width));
		}
	}

	/**
	 * Construct a matrix from constant values. Mostly useful for tests.
	 * @param in	List of rows with 1 being black
	 */
	BitMatrix(std::initializer_list<std::initializer_list<int>> in)
	{
		for (auto& row : in)
		{
			if (!width_)
				width_ = row.size();
			else
				assert(width_ == static_cast<int>(row.size()));

			std::vector<bool> r;
			for (auto v : row)
				r.push_back(v != 0);
			bits_.push_back(r);
		}
		height_ = bits_.size();
	}

	int getWidth() const
	{
		return width_;
	}

	int getHeight() const
	{
		return height_;
	}

	bool get(int x, int y) const
	{
		return bits_.at(y).at(x);
	}

	void set(int x, int y)
	{
		bits_.at(y).at(x) = true;
	}

	void unset(int x, int y)
	{
		bits_.at(y).at(x) = false;
	}

	void set(int x, int y, bool val)
	{
		bits_.at(y).at(x) = val;
	}

	void flip(int x, int y)
	{
		bits_.at(y).at(x) = !bits_.at(y).at(x);
	}

	/**
	 * Fills a rectangular region with black
	 * @param left		X of the first column
	 * @param top		Y of the first row
	 * @param width		Number of columns
	 * @param height	Number of rows
	 */
	void setRegion(int left, int top, int width, int height)
	{
		for (int y = top; y < top + height; y++)
		{
			for (int x = left; x < left + width; x++)
			{
				set(x, y);
			}
		}
	}

	/**
	 * Searches for the first black pixel in raster order, starting at the top left corner.
	 * @return	Position of the pixel or nothing if the matrix is completely white
	 */
	std::optional<cv::Point> getTopLeftOnBit() const
	{
		for (int y = 0; y < height_; y++)
		{
			for (int x = 0; x < width_; x++)
			{
				if (bits_[y][x])
					return cv::Point(x, y);
			}
		}
		return std::nullopt;
	}

	/**
	 * Searches for the first black pixel in reverse raster order, starting at the bottom right corner.
	 * @return	Position of the pixel or nothing if the matrix is completely white
	 */
	std::optional<cv::Point> getBottomRightOnBit() const
	{
		for (int y = height_ - 1; y >= 0; y--)
		{
			for (int x = width_ - 1; x >= 0; x--)
			{
				if (bits_[y][x])
					return cv::Point(x, y);
			}
		}
		return std::nullopt;
	}

	/**
	 * Converts a monochrome or grayscale image. Every pixel darker than 127 is black.
	 * @param image		Single channel 8 bit image
	 * @return			Matrix of the same size
	 */
	static BitMatrix fromMat(const cv::Mat& image)
	{
		assert(image.type() == CV_8UC1);

		BitMatrix result(image.cols, image.rows);
		for (int y = 0; y < image.rows; y++)
		{
			const uint8_t* row = image.ptr<uint8_t>(y);
			for (int x = 0; x < image.cols; x++)
			{
				if (row[x] < 127)
					result.bits_[y][x] = true;
			}
		}
		return result;
	}

	/**
	 * Renders this matrix into an OpenCV image.
	 * @return	Single channel 8 bit image with black being 0 and white being 255
	 */
	cv::Mat toMat() const
	{
		cv::Mat image(height_, width_, CV_8UC1, cv::Scalar(255));
		for (int y = 0; y < height_; y++)
		{
			uint8_t* row = image.ptr<uint8_t>(y);
			for (int x = 0; x < width_; x++)
			{
				if (bits_[y][x])
					row[x] = 0;
			}
		}
		return image;
	}

	/**
	 * Primitive debugging print of the matrix
	 */
	void print() const
	{
		for (const auto& row : bits_)
		{
			for (const auto& p : row)
			{
				printf("%d", p ? 1 : 0);
			}
			printf("\n");
		}
	}

	bool operator==(const BitMatrix& other) const
	{
		return width_ == other.width_ && height_ == other.height_ && bits_ == other.bits_;
	}

	bool operator!=(const BitMatrix& other) const
	{
		return !(*this == other);
	}
};

#endif /* BITMATRIX_H_ */
