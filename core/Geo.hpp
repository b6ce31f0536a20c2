#pragma once

namespace tripseg {

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const GeoPoint& from, const GeoPoint& to);
    
    // Rejects out-of-range values and the (0,0) fix that receivers report without a lock.
    static bool isValidCoordinate(double latitude, double longitude);
    
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;

private:
    static double toRadians(double degrees);
};

} // namespace tripseg
