/*
 * test_qrreader.cpp
 *
 *  Created on: 29.11.2021
 *      Author: andre
 */

#include "QrReader.h"
#include "SyntheticSymbol.h"
#include "gtest/gtest.h"
#include <functional>

/// Records what was requested and answers with a configurable result
class FakeDetector : public Detector
{
  public:
	std::function<DecodeOutcome<DetectorResult>(const BitMatrix&)> answer;
	mutable int calls{0};
	mutable DecodeHints last_hints;

	DecodeOutcome<DetectorResult> detect(const BitMatrix& image, const DecodeHints& hints) const override
	{
		calls++;
		last_hints = hints;
		return answer(image);
	}
};

/// Answers every call with the next prepared result
class FakeDecoder : public Decoder
{
  public:
	std::vector<DecodeOutcome<DecoderResult>> answers;
	mutable std::vector<DecodeHints> seen_hints;
	mutable std::vector<BitMatrix> seen_bits;

	DecodeOutcome<DecoderResult> decode(const BitMatrix& bits, const DecodeHints& hints) const override
	{
		seen_hints.push_back(hints);
		seen_bits.push_back(bits);

		size_t i = seen_hints.size() - 1;
		assert(i < answers.size());
		return answers.at(i);
	}
};

static DecoderResult makePayload(const std::string& text)
{
	DecoderResult r;
	r.text = text;
	r.rawBytes.assign(text.begin(), text.end());
	return r;
}

static DetectorResult makeDetection()
{
	DetectorResult d;
	d.bits = makeSymbolCells(21, 1);
	d.points.push_back(ResultPoint(3.5f, 17.5f));
	d.points.push_back(ResultPoint(3.5f, 3.5f));
	d.points.push_back(ResultPoint(17.5f, 3.5f));
	return d;
}

/// Creates a reader and gives access to the fakes it owns
struct ReaderFixture
{
	FakeDecoder* decoder;
	FakeDetector* detector;
	std::unique_ptr<QrReader> reader;

	ReaderFixture()
	{
		auto dec = std::make_unique<FakeDecoder>();
		auto det = std::make_unique<FakeDetector>();
		decoder	 = dec.get();
		detector = det.get();
		reader	 = std::make_unique<QrReader>(std::move(dec), std::move(det));
	}
};

TEST(QrReaderTest, DetectedCode)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };
	f.decoder->answers.push_back(makePayload("hello"));

	auto result = f.reader->decode(BitMatrix(30, 30));
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().text, "hello");
	ASSERT_EQ(result.value().rawBytes, std::vector<uint8_t>({'h', 'e', 'l', 'l', 'o'}));
	ASSERT_EQ(result.value().format, BarcodeFormat::kQrCode);
	ASSERT_EQ(result.value().points, makeDetection().points);
	ASSERT_TRUE(result.value().metadata.empty());

	ASSERT_EQ(f.detector->calls, 1);
	ASSERT_EQ(f.decoder->seen_hints.size(), 1u);
	ASSERT_TRUE(f.decoder->seen_bits.at(0) == makeDetection().bits);
}

TEST(QrReaderTest, TryHarderIsForcedUnlessExplicitlyDisabled)
{
	{
		ReaderFixture f;
		f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };
		f.decoder->answers.push_back(makePayload("a"));

		DecodeHints hints;
		hints.characterSet			   = "ISO-8859-1";
		hints.extensions["allowedEci"] = "26";

		ASSERT_TRUE(f.reader->decode(BitMatrix(30, 30), hints).isValid());
		ASSERT_TRUE(f.detector->last_hints.isTryHarder());
		ASSERT_TRUE(f.decoder->seen_hints.at(0).isTryHarder());
		ASSERT_EQ(f.decoder->seen_hints.at(0).characterSet, "ISO-8859-1");
		ASSERT_EQ(f.decoder->seen_hints.at(0).extensions.at("allowedEci"), "26");

		// Callers hints are untouched
		ASSERT_FALSE(hints.tryHarder.has_value());
		ASSERT_FALSE(hints.pureBarcode.has_value());
	}

	{
		ReaderFixture f;
		f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };
		f.decoder->answers.push_back(makePayload("a"));

		DecodeHints hints;
		hints.tryHarder = false;

		ASSERT_TRUE(f.reader->decode(BitMatrix(30, 30), hints).isValid());
		ASSERT_FALSE(f.decoder->seen_hints.at(0).isTryHarder());
	}
}

TEST(QrReaderTest, FallbackToPureBarcode)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) {
		return DecodeOutcome<DetectorResult>(DecodeError::notFound("no finder patterns"));
	};
	f.decoder->answers.push_back(makePayload("pure"));

	BitMatrix cells = makeSymbolCells(21, 5);
	BitMatrix image = renderSymbol(cells, 4, 0);

	auto result = f.reader->decode(image);
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().text, "pure");
	ASSERT_TRUE(result.value().points.empty());

	ASSERT_EQ(f.detector->calls, 1);
	ASSERT_EQ(f.decoder->seen_hints.size(), 1u);
	ASSERT_TRUE(f.decoder->seen_hints.at(0).isPureBarcode());
	ASSERT_TRUE(f.decoder->seen_hints.at(0).isTryHarder());
	ASSERT_TRUE(f.decoder->seen_bits.at(0) == cells);
}

TEST(QrReaderTest, FallbackAfterDecoderFailure)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };
	f.decoder->answers.push_back(DecodeError::format("bad format"));
	f.decoder->answers.push_back(makePayload("second"));

	auto result = f.reader->decode(renderSymbol(makeSymbolCells(25, 1), 3, 1));
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().text, "second");
	ASSERT_TRUE(result.value().points.empty());
	ASSERT_EQ(f.decoder->seen_hints.size(), 2u);
	ASSERT_FALSE(f.decoder->seen_hints.at(0).isPureBarcode());
	ASSERT_TRUE(f.decoder->seen_hints.at(1).isPureBarcode());
}

TEST(QrReaderTest, FirstErrorIsReportedIfFallbackFails)
{
	{
		// Fallback fails during extraction
		ReaderFixture f;
		f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };
		f.decoder->answers.push_back(DecodeError::checksum("too many errors"));

		auto result = f.reader->decode(BitMatrix(30, 30));
		ASSERT_FALSE(result.isValid());
		ASSERT_EQ(result.error(), DecodeError::checksum("too many errors"));
		ASSERT_EQ(f.decoder->seen_hints.size(), 1u);
	}

	{
		// Fallback fails during decoding
		ReaderFixture f;
		f.detector->answer = [](const BitMatrix&) {
			return DecodeOutcome<DetectorResult>(DecodeError::notFound("no finder patterns"));
		};
		f.decoder->answers.push_back(DecodeError::format("bad format"));

		auto result = f.reader->decode(renderSymbol(makeSymbolCells(21, 1), 2, 2));
		ASSERT_FALSE(result.isValid());
		ASSERT_EQ(result.error(), DecodeError::notFound("no finder patterns"));
		ASSERT_EQ(f.decoder->seen_hints.size(), 1u);
		ASSERT_TRUE(f.decoder->seen_hints.at(0).isPureBarcode());
	}
}

TEST(QrReaderTest, PureBarcodeRequestedHasNoFallback)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };

	DecodeHints hints;
	hints.pureBarcode = true;

	auto result = f.reader->decode(BitMatrix(30, 30), hints);
	ASSERT_FALSE(result.isValid());
	ASSERT_EQ(result.error().cause(), DecodeError::Cause::kNotFound);
	ASSERT_EQ(f.detector->calls, 0);
	ASSERT_TRUE(f.decoder->seen_hints.empty());
}

TEST(QrReaderTest, PureBarcodeRequestedDecoderFailure)
{
	ReaderFixture f;
	f.decoder->answers.push_back(DecodeError::checksum());

	DecodeHints hints;
	hints.pureBarcode = true;

	auto result = f.reader->decode(renderSymbol(makeSymbolCells(21, 1), 3, 0), hints);
	ASSERT_FALSE(result.isValid());
	ASSERT_EQ(result.error().cause(), DecodeError::Cause::kChecksum);
	ASSERT_EQ(f.detector->calls, 0);
	ASSERT_EQ(f.decoder->seen_hints.size(), 1u);
}

TEST(QrReaderTest, MirroredCodeSwapsPoints)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };

	DecoderResult payload = makePayload("mirror");
	payload.metaData	  = QrCodeMetaData(true);
	f.decoder->answers.push_back(payload);

	auto result = f.reader->decode(BitMatrix(30, 30));
	ASSERT_TRUE(result.isValid());

	auto original = makeDetection().points;
	const auto& points = result.value().points;
	ASSERT_EQ(points.size(), 3u);
	ASSERT_EQ(points.at(0), original.at(2));
	ASSERT_EQ(points.at(1), original.at(1));
	ASSERT_EQ(points.at(2), original.at(0));
}

TEST(QrReaderTest, NotMirroredCodeKeepsPoints)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };

	DecoderResult payload = makePayload("plain");
	payload.metaData	  = QrCodeMetaData(false);
	f.decoder->answers.push_back(payload);

	auto result = f.reader->decode(BitMatrix(30, 30));
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().points, makeDetection().points);
}

TEST(QrReaderTest, MetadataFromDecoder)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };

	std::vector<std::vector<uint8_t>> segments{{0x41, 0x42}, {0xc3, 0x84}};

	DecoderResult payload				   = makePayload("AB\xc3\x84");
	payload.byteSegments				   = segments;
	payload.ecLevel						   = "Q";
	payload.structuredAppendSequenceNumber = 0x21;
	payload.structuredAppendParity		   = 0x5a;
	f.decoder->answers.push_back(payload);

	auto result = f.reader->decode(BitMatrix(30, 30));
	ASSERT_TRUE(result.isValid());

	const auto& metadata = result.value().metadata;
	ASSERT_EQ(metadata.size(), 4u);
	ASSERT_EQ(std::get<std::vector<std::vector<uint8_t>>>(metadata.at(ResultMetadataType::kByteSegments)), segments);
	ASSERT_EQ(std::get<std::string>(metadata.at(ResultMetadataType::kErrorCorrectionLevel)), "Q");
	ASSERT_EQ(std::get<int>(metadata.at(ResultMetadataType::kStructuredAppendSequence)), 0x21);
	ASSERT_EQ(std::get<int>(metadata.at(ResultMetadataType::kStructuredAppendParity)), 0x5a);
}

TEST(QrReaderTest, OnlyAvailableMetadata)
{
	ReaderFixture f;
	f.detector->answer = [](const BitMatrix&) { return DecodeOutcome<DetectorResult>(makeDetection()); };

	DecoderResult payload = makePayload("x");
	payload.ecLevel		  = "L";
	// Parity without sequence number is no structured append
	payload.structuredAppendParity = 3;
	f.decoder->answers.push_back(payload);

	auto result = f.reader->decode(BitMatrix(30, 30));
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().metadata.size(), 1u);
	ASSERT_TRUE(result.value().hasMetadata(ResultMetadataType::kErrorCorrectionLevel));
	ASSERT_FALSE(result.value().hasMetadata(ResultMetadataType::kByteSegments));
	ASSERT_FALSE(result.value().hasMetadata(ResultMetadataType::kStructuredAppendSequence));
	ASSERT_FALSE(result.value().hasMetadata(ResultMetadataType::kStructuredAppendParity));
}

TEST(QrReaderTest, DefaultDetectorEndToEnd)
{
	auto dec		= std::make_unique<FakeDecoder>();
	FakeDecoder* fd = dec.get();
	fd->answers.push_back(makePayload("found"));
	QrReader reader(std::move(dec));

	BitMatrix cells = makeSymbolCells(21, 11);
	auto result		= reader.decode(renderSymbol(cells, 8, 4));
	ASSERT_TRUE(result.isValid());
	ASSERT_EQ(result.value().points.size(), 3u);
	ASSERT_FALSE(fd->seen_hints.at(0).isPureBarcode());
	ASSERT_TRUE(fd->seen_bits.at(0) == cells);
}

TEST(QrReaderTest, DebugModeTracesPureBarcodeExtraction)
{
	ReaderFixture f;
	f.reader->debugMode = true;

	DecodeHints hints;
	hints.pureBarcode = true;

	testing::internal::CaptureStdout();
	auto result		   = f.reader->decode(BitMatrix(30, 30), hints);
	std::string output = testing::internal::GetCapturedStdout();

	ASSERT_FALSE(result.isValid());
	ASSERT_NE(output.find("Unable to locate grid: Image is empty"), std::string::npos);
}

TEST(QrReaderTest, SilentWithoutDebugMode)
{
	ReaderFixture f;

	DecodeHints hints;
	hints.pureBarcode = true;

	testing::internal::CaptureStdout();
	auto result = f.reader->decode(BitMatrix(30, 30), hints);
	ASSERT_FALSE(result.isValid());
	ASSERT_TRUE(testing::internal::GetCapturedStdout().empty());
}
