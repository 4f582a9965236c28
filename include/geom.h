/*! \file */
#ifndef _GEOM_TYPES_H
#define _GEOM_TYPES_H

#ifdef _MSC_VER
using uint = unsigned int;
#endif

#include <vector>
#include <limits>

// boost::geometry
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/geometries.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/variant.hpp>

// Points are lon/lat (feature geometries), screen pixels, or tile-local units,
// depending on where they are used.
typedef boost::geometry::model::d2::point_xy<double> Point;
typedef boost::geometry::model::multi_point<Point> MultiPoint;
typedef boost::geometry::model::linestring<Point> Linestring;
typedef boost::geometry::model::polygon<Point> Polygon;
typedef boost::geometry::model::multi_polygon<Polygon> MultiPolygon;
typedef boost::geometry::model::multi_linestring<Linestring> MultiLinestring;
typedef boost::geometry::model::box<Point> Box;
typedef boost::geometry::ring_type<Polygon>::type Ring;

// A GeoJSON geometry. boost::blank stands for a null geometry.
typedef boost::variant<boost::blank,Point,MultiPoint,Linestring,MultiLinestring,Polygon,MultiPolygon> Geometry;

namespace geom = boost::geometry;

#endif //_GEOM_TYPES_H
