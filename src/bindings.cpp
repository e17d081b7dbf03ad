#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "planfix/planfix.hpp"

namespace py = pybind11;

namespace {
// Failed results surface as None on the Python side.
template<typename T>
py::object to_python(const planfix::Result<T>& result) {
    if (!result) return py::none();
    return py::cast(*result);
}
}

PYBIND11_MODULE(_planfix_cpp, m) {
    m.doc() = "planfix C++ backend: GPS to floor-plan calibration";
    m.attr("__version__") = planfix::VERSION;

    py::enum_<planfix::Status>(m, "Status")
        .value("ok", planfix::Status::ok)
        .value("not_calibrated", planfix::Status::not_calibrated)
        .value("degenerate", planfix::Status::degenerate);

    py::enum_<planfix::TransformKind>(m, "TransformKind")
        .value("affine", planfix::TransformKind::affine)
        .value("similarity", planfix::TransformKind::similarity);

    py::class_<planfix::GeoPoint>(m, "GeoPoint")
        .def(py::init<double, double>(), py::arg("lat"), py::arg("lon"))
        .def_readwrite("lat", &planfix::GeoPoint::lat)
        .def_readwrite("lon", &planfix::GeoPoint::lon);

    py::class_<planfix::PixelPoint>(m, "PixelPoint")
        .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &planfix::PixelPoint::x)
        .def_readwrite("y", &planfix::PixelPoint::y);

    py::class_<planfix::ControlPoint>(m, "ControlPoint")
        .def(py::init<planfix::GeoPoint, planfix::PixelPoint>(), py::arg("geo"), py::arg("pixel"))
        .def_readwrite("geo", &planfix::ControlPoint::geo)
        .def_readwrite("pixel", &planfix::ControlPoint::pixel);

    py::class_<planfix::PlanTransform>(m, "PlanTransform")
        .def_static("solve", [](const planfix::Calibration& calibration) {
            return to_python(planfix::PlanTransform::solve(calibration));
        }, py::arg("calibration"))
        .def_property_readonly("kind", &planfix::PlanTransform::kind)
        .def_property_readonly("coefficients", &planfix::PlanTransform::coefficients)
        .def_property_readonly("north_angle", &planfix::PlanTransform::north_angle)
        .def("latlon_to_pixel", &planfix::PlanTransform::latlon_to_pixel, py::arg("lat"), py::arg("lon"))
        .def("pixel_to_latlon", [](const planfix::PlanTransform& t, double x, double y) {
            return to_python(t.pixel_to_latlon(x, y));
        }, py::arg("x"), py::arg("y"));

    py::class_<planfix::TransformEngine>(m, "TransformEngine")
        .def(py::init<>())
        .def_property_readonly("is_calibrated", &planfix::TransformEngine::is_calibrated)
        .def_property_readonly("version", &planfix::TransformEngine::version)
        .def("set_calibration",
             py::overload_cast<const planfix::ControlPoint&, const planfix::ControlPoint&,
                               const planfix::ControlPoint&>(&planfix::TransformEngine::set_calibration),
             py::arg("p1"), py::arg("p2"), py::arg("p3"))
        .def("clear_calibration", &planfix::TransformEngine::clear_calibration)
        .def("calibration", [](const planfix::TransformEngine& e) { return to_python(e.calibration()); })
        .def("world_to_pixel", [](const planfix::TransformEngine& e, double lat, double lon) {
            return to_python(e.world_to_pixel(lat, lon));
        }, py::arg("lat"), py::arg("lon"))
        .def("north_angle", &planfix::TransformEngine::north_angle)
        .def("pixels_per_meter", [](const planfix::TransformEngine& e) { return to_python(e.pixels_per_meter()); })
        .def("add_listener", [](planfix::TransformEngine& e, py::function listener) {
            return e.add_listener([listener](const planfix::TransformEngine& engine) {
                py::gil_scoped_acquire gil;
                listener(py::cast(&engine, py::return_value_policy::reference));
            });
        }, py::arg("listener"))
        .def("remove_listener", &planfix::TransformEngine::remove_listener, py::arg("id"));

    py::class_<planfix::ViewportOptions>(m, "ViewportOptions")
        .def(py::init<>())
        .def_readwrite("visible_meters", &planfix::ViewportOptions::visible_meters)
        .def_readwrite("content_scale", &planfix::ViewportOptions::content_scale)
        .def_readwrite("min_zoom", &planfix::ViewportOptions::min_zoom)
        .def_readwrite("max_zoom", &planfix::ViewportOptions::max_zoom);

    m.def("zoom_for_visible_distance",
          [](const planfix::TransformEngine& e, double viewport_width_px, const planfix::ViewportOptions& options) {
              return to_python(planfix::zoom_for_visible_distance(e, viewport_width_px, options));
          }, py::arg("engine"), py::arg("viewport_width_px"), py::arg("options") = planfix::ViewportOptions{});
    m.def("marker_heading_deg", &planfix::marker_heading_deg,
          py::arg("speed_mps"), py::arg("gps_heading_deg"), py::arg("compass_heading_deg"));
    m.def("marker_rotation", &planfix::marker_rotation, py::arg("north_angle_rad"), py::arg("heading_deg"));
    m.def("haversine_distance_m", &planfix::haversine_distance_m,
          py::arg("lat1"), py::arg("lon1"), py::arg("lat2"), py::arg("lon2"));

    py::class_<planfix::SavedPlan>(m, "SavedPlan")
        .def(py::init<>())
        .def_readwrite("id", &planfix::SavedPlan::id)
        .def_readwrite("name", &planfix::SavedPlan::name)
        .def_readwrite("file_path", &planfix::SavedPlan::file_path)
        .def_readwrite("calibration", &planfix::SavedPlan::calibration)
        .def_readwrite("last_opened", &planfix::SavedPlan::last_opened)
        .def("to_json", [](const planfix::SavedPlan& p) { return planfix::to_json(p); })
        .def_static("from_json", &planfix::saved_plan_from_json, py::arg("json"));

    py::class_<planfix::PlanStore>(m, "PlanStore")
        .def(py::init<std::string>(), py::arg("path"))
        .def_property_readonly("path", &planfix::PlanStore::path)
        .def("load", &planfix::PlanStore::load)
        .def("save", &planfix::PlanStore::save, py::arg("plan"))
        .def("remove", &planfix::PlanStore::remove, py::arg("id"));

    m.def("set_log_level", &planfix::set_log_level, py::arg("name"));
}
