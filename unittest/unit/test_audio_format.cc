#include <doctest/doctest.h>
#include <ringplay/sdk/audio_format.hh>
#include <ringplay/sdk/buffer.hh>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace ringplay;

TEST_SUITE("Core::AudioFormat") {
    TEST_CASE("Audio format properties") {
        SUBCASE("Byte size") {
            CHECK(audio_format_byte_size(audio_format::s16le) == 2);
            CHECK(audio_format_byte_size(audio_format::s32le) == 4);
            CHECK(audio_format_byte_size(audio_format::f32le) == 4);
            CHECK(audio_format_byte_size(audio_format::f32be) == 4);
            CHECK(audio_format_byte_size(audio_format::unknown) == 0);
        }

        SUBCASE("Names") {
            std::ostringstream os;
            os << audio_format::f32le << " " << audio_format::s16le;
            CHECK(os.str() == "f32le s16le");
        }
    }

    TEST_CASE("Audio spec defaults to the pipeline format") {
        audio_spec spec;
        CHECK(spec.format == audio_format::f32le);
        CHECK(spec.channels == 2);
        CHECK(spec.freq == 48000);
        CHECK(spec.period_frames == 128);

        std::ostringstream os;
        os << spec;
        CHECK(os.str() == "audio_spec{format=f32le, channels=2, freq=48000, period_frames=128}");
    }
}

TEST_SUITE("Core::Buffer") {
    TEST_CASE("Buffer starts zeroed and checks bounds") {
        buffer<float> buf(8);
        CHECK(buf.size() == 8);
        CHECK_FALSE(buf.empty());
        for (float v : buf) {
            CHECK(v == 0.0f);
        }
        CHECK_THROWS_AS(buf.at(8), std::out_of_range);
    }

    TEST_CASE("Buffer copies ranges in and out") {
        buffer<float> buf(8);
        const float src[] = {1.0f, 2.0f, 3.0f};
        buf.copy_in(5, src, 3);
        CHECK(buf[5] == 1.0f);
        CHECK(buf[7] == 3.0f);

        float dst[3] = {};
        buf.copy_out(5, dst, 3);
        CHECK(dst[1] == 2.0f);

        buf.clear();
        CHECK(buf[6] == 0.0f);
    }

    TEST_CASE("Buffer moves ownership") {
        buffer<float> a(4);
        a[0] = 9.0f;
        buffer<float> b(std::move(a));
        CHECK(b.size() == 4);
        CHECK(b[0] == 9.0f);
    }
}
