#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "ImageWrapper.hpp"

namespace py = pybind11;

namespace {

py::buffer_info describeImage(XBridge::ImageWrapper& image) {
    const std::size_t bpp = image.bytesPerPixel();
    return py::buffer_info(
        const_cast<std::uint8_t*>(image.pixels()),
        sizeof(std::uint8_t),
        py::format_descriptor<std::uint8_t>::format(),
        3,
        { static_cast<py::ssize_t>(image.height()), static_cast<py::ssize_t>(image.width()),
          static_cast<py::ssize_t>(bpp) },
        { static_cast<py::ssize_t>(image.stride()), static_cast<py::ssize_t>(bpp),
          static_cast<py::ssize_t>(1) },
        true
    );
}

} // namespace

void bind_image(py::module_& m) {
    using XBridge::ImageWrapper;

    py::class_<ImageWrapper, std::unique_ptr<ImageWrapper>>(m, "ImageWrapper", py::buffer_protocol(), R"doc(
        A window capture backed by a shared-memory segment.
        Call release() (or freeze()) before the next capture cycle.
    )doc")
        .def_property_readonly("x", &ImageWrapper::x)
        .def_property_readonly("y", &ImageWrapper::y)
        .def_property_readonly("width", &ImageWrapper::width)
        .def_property_readonly("height", &ImageWrapper::height)
        .def_property_readonly("depth", &ImageWrapper::depth)
        .def_property_readonly("bits_per_pixel", &ImageWrapper::bitsPerPixel)
        .def_property_readonly("stride", &ImageWrapper::stride, "The number of bytes per row.")
        .def_property_readonly("pixel_format", &ImageWrapper::pixelFormat)
        .def_property_readonly("size", &ImageWrapper::size)
        .def_property_readonly("released", &ImageWrapper::isReleased)
        .def_property_readonly("frozen", &ImageWrapper::isFrozen)

        .def("restride", &ImageWrapper::restride, py::arg("stride"),
             "Copies the pixels with a new row stride and lets go of the segment.")
        .def("freeze", &ImageWrapper::freeze,
             "Copies the pixels so the segment can be reused.")
        .def("release", &ImageWrapper::release)

        .def("tobytes", [](const ImageWrapper& image) {
            return py::bytes(reinterpret_cast<const char*>(image.pixels()), image.size());
        })

        // Zero-copy view, the array keeps the wrapper alive
        .def_property_readonly("view", [](ImageWrapper& image) {
            const std::size_t bpp = image.bytesPerPixel();
            py::array_t<std::uint8_t> array(
                { static_cast<std::size_t>(image.height()), static_cast<std::size_t>(image.width()), bpp },
                { image.stride(), bpp, std::size_t(1) },
                image.pixels(),
                py::cast(image, py::return_value_policy::reference)
            );
            array.attr("flags").attr("writeable") = false;
            return array;
        }, "Returns a read-only NumPy view of the pixels, valid until release().")

        .def_buffer(&describeImage);
}
