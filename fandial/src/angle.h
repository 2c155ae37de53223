#pragma once

/// Angle in radians. Screen space: positive angles turn clockwise, since Y grows downwards.
class Angle final {
public:
  static Angle FromDeg(float deg);
  static Angle Pi();

  constexpr Angle() = default;
  explicit Angle(float rad) : rad_(rad) {}
  ~Angle() = default;

  Angle(Angle const&) = default;
  Angle& operator=(Angle const&) = default;
  Angle(Angle&&) = default;
  Angle& operator=(Angle&&) = default;

  float AsRad() const { return rad_; }

  /// Wrap into [0, 2π).
  Angle WrapAround() const;

  float ToDeg() const;
  float Sin() const;
  float Cos() const;

  Angle operator+(Angle const& other) const { return Angle(rad_ + other.rad_); }
  Angle operator-(Angle const& other) const { return Angle(rad_ - other.rad_); }
  Angle operator*(float scalar) const { return Angle(rad_ * scalar); }
  Angle operator/(float scalar) const { return Angle(rad_ / scalar); }
  bool operator==(Angle const& other) const { return rad_ == other.rad_; }
  bool operator!=(Angle const& other) const { return rad_ != other.rad_; }

  friend Angle operator*(float scalar, Angle const& angle) { return Angle(angle.rad_ * scalar); }

private:
  float rad_ = 0.0f;
};
